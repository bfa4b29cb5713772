#ifndef EXAM_CONFIDENCE_AGGREGATOR_HPP
#define EXAM_CONFIDENCE_AGGREGATOR_HPP

#include "ExtractedQuestion.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace exam {

/**
 * @brief Document-level confidence statistics
 */
struct DocumentStatistics {
  std::size_t total = 0;
  std::size_t high = 0;
  std::size_t medium = 0;
  std::size_t low = 0;
  double averageConfidence = 0.0;
  std::size_t needsReviewCount = 0;
  std::map<std::string, std::size_t> byQuestionType;
};

/**
 * @brief Computes question scores and document statistics
 */
class ConfidenceAggregator {
public:
  /**
   * @brief Statistics over a question list
   *
   * Tiers are recomputed from each question's score, so the result only
   * depends on the scores and types.
   */
  static DocumentStatistics compute(const std::vector<ExtractedQuestion> &questions);

  /**
   * @brief Score of a question on the 0-100 scale
   * @param detectionConfidence Region detection confidence (0-1)
   * @param ocrConfidence OCR confidence of the region text (0-100), if any
   * @return 100 * detection, blended 60/40 with OCR when present
   */
  static double scoreQuestion(double detectionConfidence,
                              std::optional<double> ocrConfidence);
};

} // namespace exam

#endif // EXAM_CONFIDENCE_AGGREGATOR_HPP

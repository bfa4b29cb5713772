#ifndef EXAM_EXTRACTED_QUESTION_HPP
#define EXAM_EXTRACTED_QUESTION_HPP

#include "Region.hpp"

#include <optional>
#include <string>
#include <vector>

namespace exam {

enum class QuestionType { MCQ, MultiSelect, TrueFalse, FillBlank, Essay, Unknown };

enum class ConfidenceLevel { High, Medium, Low };

std::string questionTypeToString(QuestionType type);
std::string confidenceLevelToString(ConfidenceLevel level);

/**
 * @brief Tier of a 0-100 score: high >= 80, medium >= 60, otherwise low
 */
ConfidenceLevel confidenceLevelFor(double score);

/**
 * @brief A question record produced by the extraction pipeline
 */
struct ExtractedQuestion {
  std::string questionText;
  QuestionType questionType = QuestionType::Unknown;
  std::vector<QuestionOption> options;
  std::vector<std::string> correctAnswers; ///< Option letters, e.g. {"b"}
  double confidenceScore = 0.0;            ///< 0-100
  ConfidenceLevel confidenceLevel = ConfidenceLevel::Low;
  bool requiresReview = true;
  int pageNumber = 1;
  std::optional<int> questionNumber;
  Region position;                         ///< Source region on the page
  std::string extractionMethod;            ///< structural, geometric, text
};

/**
 * @brief Set score, level and review flag together
 *
 * The score is clamped to [0, 100]; review is required exactly when the
 * level is low.
 */
void applyConfidence(ExtractedQuestion &question, double score);

} // namespace exam

#endif // EXAM_EXTRACTED_QUESTION_HPP

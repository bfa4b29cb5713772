#ifndef EXAM_QUESTION_DETECTOR_HPP
#define EXAM_QUESTION_DETECTOR_HPP

#include "LayoutAnalysis.hpp"
#include "Region.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace exam {

struct QuestionDetectorConfig {
  int maxQuestionLines = 8;     ///< Stem lines before a question is closed
  int sameColumnTolerance = 60; ///< Max |option x - question x|
  int padding = 8;              ///< Padding around a group box
  double baseConfidence = 0.95;
  double maxConfidence = 0.98;
};

/**
 * @brief A numbered question start with its continuation lines
 */
struct QuestionCandidate {
  int number = 0;
  std::vector<TextLine> lines; ///< First line holds the number
  std::string stem;            ///< Text without the number prefix

  int x() const { return lines.front().x; }
  int y() const { return lines.front().y; }
  int endY() const { return lines.back().y2(); }
};

/**
 * @brief A lettered option found on a line
 */
struct OptionCandidate {
  char letter = 'a';
  std::string text;
  TextLine line; ///< Line the option was read from
};

/**
 * @brief Question groups of a page plus the areas that failed validation
 */
struct StructuralResult {
  std::vector<QuestionGroup> groups;
  std::vector<cv::Rect> rejectedAreas;
  int columnCount = 0;
};

/**
 * @brief Finds numbered questions and their lettered options in OCR lines
 */
class QuestionDetector {
public:
  explicit QuestionDetector(
      const QuestionDetectorConfig &config = QuestionDetectorConfig());

  /**
   * @brief Match "12. ", "Q12:" or "12)" at the start of a line
   * @param text Line text
   * @param prefixLength Receives the length of the matched prefix
   * @return Question number if the line starts a question
   */
  static std::optional<int> matchQuestionStart(const std::string &text,
                                               std::size_t *prefixLength =
                                                   nullptr);

  /**
   * @brief Options on a line that starts with "(a)".."(d)"
   *
   * A line may carry several options, e.g. "(a) 30   (b) 35".
   */
  static std::vector<QuestionOption> matchOptions(const std::string &text);

  /**
   * @brief Option letters form the prefix a, b, c, d of the alphabet
   *
   * An empty option list is valid.
   */
  static bool isValidOptionSequence(const std::vector<QuestionOption> &options);

  std::vector<QuestionCandidate>
  findQuestions(const std::vector<TextLine> &lines) const;

  std::vector<OptionCandidate>
  findOptions(const std::vector<TextLine> &lines) const;

  /**
   * @brief Group the questions and options of one column
   * @param column Column lines sorted top to bottom
   * @param pageNumber Page the lines belong to
   * @param pageSize Raster size used to clamp boxes
   */
  StructuralResult groupColumn(const Column &column, int pageNumber,
                               const cv::Size &pageSize) const;

  /**
   * @brief Detect columns and group every column of a page
   */
  StructuralResult detect(const std::vector<TextLine> &lines, int pageNumber,
                          const cv::Size &pageSize,
                          const ColumnConfig &columns = ColumnConfig()) const;

  /**
   * @brief Group confidence for a number of options (0-1)
   */
  double confidenceFor(std::size_t optionCount) const;

  const QuestionDetectorConfig &config() const { return m_config; }

private:
  QuestionDetectorConfig m_config;
};

} // namespace exam

#endif // EXAM_QUESTION_DETECTOR_HPP

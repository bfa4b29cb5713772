#ifndef EXAM_QUESTION_PARSER_HPP
#define EXAM_QUESTION_PARSER_HPP

#include "ExtractedQuestion.hpp"
#include "Region.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace exam {

/**
 * @brief Structure recovered from the text of one question block
 */
struct ParsedQuestion {
  std::optional<int> questionNumber;
  std::string questionText;               ///< Stem without number prefix
  std::vector<QuestionOption> options;    ///< Sorted by letter, unique
  std::vector<std::string> correctAnswers; ///< From "Answer: (b)" lines
};

/**
 * @brief Splits question text into stem, options and answer key
 */
class QuestionParser {
public:
  /**
   * @brief Parse one question block
   *
   * Lines holding options ("(a) 30  (b) 35" or "a) 30 b) 35") become
   * options, answer-key lines ("Answer: (b)", "Ans. b") become correct
   * answers, everything else is the question stem.
   */
  ParsedQuestion parse(const std::string &text) const;

  /**
   * @brief Split page text into blocks that each start with a question
   *        number; text before the first question is dropped
   */
  std::vector<std::string> splitQuestionBlocks(const std::string &pageText) const;

  /**
   * @brief Options found on one line
   */
  static std::vector<QuestionOption> optionsOnLine(const std::string &line);

  /**
   * @brief Answer letters from an answer-key line, empty if not one
   */
  static std::vector<std::string> answerKey(const std::string &line);

  /**
   * @brief Question number at the start of a line
   * @param prefixLength Receives the length of the number prefix
   */
  static std::optional<int> questionNumber(const std::string &line,
                                           std::size_t *prefixLength = nullptr);
};

/**
 * @brief Pattern based question type classifier
 */
class QuestionTypeClassifier {
public:
  /**
   * @brief Classify a question
   * @return Type and classification confidence (0-1)
   */
  std::pair<QuestionType, double>
  classify(const std::string &questionText,
           const std::vector<QuestionOption> &options) const;
};

} // namespace exam

#endif // EXAM_QUESTION_PARSER_HPP

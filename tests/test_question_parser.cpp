#include "QuestionDetector.hpp"
#include "QuestionParser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

using namespace exam;

TEST(QuestionParserTest, ParsesNumberedQuestionWithAnswerKey) {
  QuestionParser parser;
  ParsedQuestion parsed = parser.parse("1. What is the capital of France?\n"
                                       "(a) Paris (b) London\n"
                                       "(c) Berlin (d) Madrid\n"
                                       "Answer: (a)");

  ASSERT_TRUE(parsed.questionNumber.has_value());
  EXPECT_EQ(*parsed.questionNumber, 1);
  EXPECT_EQ(parsed.questionText, "What is the capital of France?");
  ASSERT_EQ(parsed.options.size(), 4u);
  EXPECT_EQ(parsed.options[0], (QuestionOption{'a', "Paris"}));
  EXPECT_EQ(parsed.options[1], (QuestionOption{'b', "London"}));
  EXPECT_EQ(parsed.options[2], (QuestionOption{'c', "Berlin"}));
  EXPECT_EQ(parsed.options[3], (QuestionOption{'d', "Madrid"}));
  EXPECT_EQ(parsed.correctAnswers, (std::vector<std::string>{"a"}));
}

TEST(QuestionParserTest, MultiLineStemIsJoined) {
  QuestionParser parser;
  ParsedQuestion parsed = parser.parse("Q3. Which of the following\n"
                                       "numbers are prime?\n"
                                       "a) 4\n"
                                       "b) 7\n"
                                       "Ans: b, d");

  EXPECT_EQ(parsed.questionNumber.value_or(0), 3);
  EXPECT_EQ(parsed.questionText, "Which of the following numbers are prime?");
  ASSERT_EQ(parsed.options.size(), 2u);
  EXPECT_EQ(parsed.options[1].text, "7");
  EXPECT_EQ(parsed.correctAnswers, (std::vector<std::string>{"b", "d"}));
}

TEST(QuestionParserTest, OptionsAreSortedAndUnique) {
  QuestionParser parser;
  ParsedQuestion parsed =
      parser.parse("2) Pick one\n(c) three\n(a) one\n(b) two\n(a) again");
  ASSERT_EQ(parsed.options.size(), 3u);
  EXPECT_EQ(parsed.options[0], (QuestionOption{'a', "one"}));
  EXPECT_EQ(parsed.options[1], (QuestionOption{'b', "two"}));
  EXPECT_EQ(parsed.options[2], (QuestionOption{'c', "three"}));
  EXPECT_TRUE(QuestionDetector::isValidOptionSequence(parsed.options));
}

TEST(QuestionParserTest, GappedLettersFailTheSequenceCheck) {
  QuestionParser parser;
  ParsedQuestion parsed = parser.parse("1. Pick one\n(a) one\n(c) three");
  ASSERT_EQ(parsed.options.size(), 2u);
  EXPECT_EQ(parsed.options[1].letter, 'c');
  EXPECT_FALSE(QuestionDetector::isValidOptionSequence(parsed.options));
}

TEST(QuestionParserTest, OptionTextMayContainParentheses) {
  QuestionParser parser;
  ParsedQuestion parsed = parser.parse("2. Evaluate\n"
                                       "(a) f(x) = 2\n"
                                       "(b) g(x) = 3\n"
                                       "(c) 4\n"
                                       "(d) 5");
  EXPECT_EQ(parsed.questionText, "Evaluate");
  ASSERT_EQ(parsed.options.size(), 4u);
  EXPECT_EQ(parsed.options[0], (QuestionOption{'a', "f(x) = 2"}));
  EXPECT_EQ(parsed.options[1], (QuestionOption{'b', "g(x) = 3"}));
  EXPECT_EQ(parsed.options[2], (QuestionOption{'c', "4"}));
  EXPECT_EQ(parsed.options[3], (QuestionOption{'d', "5"}));

  std::vector<QuestionOption> onOneLine =
      QuestionParser::optionsOnLine("(a) sin(x) (b) cos(x)");
  ASSERT_EQ(onOneLine.size(), 2u);
  EXPECT_EQ(onOneLine[0], (QuestionOption{'a', "sin(x)"}));
  EXPECT_EQ(onOneLine[1], (QuestionOption{'b', "cos(x)"}));

  std::vector<QuestionOption> bare = QuestionParser::optionsOnLine("a) max(1, 2) b) 3");
  ASSERT_EQ(bare.size(), 2u);
  EXPECT_EQ(bare[0], (QuestionOption{'a', "max(1, 2)"}));
  EXPECT_EQ(bare[1], (QuestionOption{'b', "3"}));
}

TEST(QuestionParserTest, QuestionWithoutOptions) {
  QuestionParser parser;
  ParsedQuestion parsed = parser.parse("Question 4: Explain photosynthesis.");
  EXPECT_EQ(parsed.questionNumber.value_or(0), 4);
  EXPECT_EQ(parsed.questionText, "Explain photosynthesis.");
  EXPECT_TRUE(parsed.options.empty());
  EXPECT_TRUE(parsed.correctAnswers.empty());
}

TEST(QuestionParserTest, QuestionNumberForms) {
  EXPECT_EQ(QuestionParser::questionNumber("12. Text").value_or(0), 12);
  EXPECT_EQ(QuestionParser::questionNumber("Q.5 Text").value_or(0), 5);
  EXPECT_EQ(QuestionParser::questionNumber("Question 7) Text").value_or(0), 7);
  EXPECT_EQ(QuestionParser::questionNumber("(8) Text").value_or(0), 8);
  EXPECT_EQ(QuestionParser::questionNumber("[9] Text").value_or(0), 9);
  EXPECT_FALSE(QuestionParser::questionNumber("The year 1990 was").has_value());

  std::size_t prefix = 0;
  ASSERT_TRUE(QuestionParser::questionNumber("3. What", &prefix).has_value());
  EXPECT_EQ(prefix, 3u);
}

TEST(QuestionParserTest, AnswerKeyLines) {
  EXPECT_EQ(QuestionParser::answerKey("Answer: (b)"),
            (std::vector<std::string>{"b"}));
  EXPECT_EQ(QuestionParser::answerKey("Correct answer is C"),
            (std::vector<std::string>{"c"}));
  EXPECT_EQ(QuestionParser::answerKey("Ans - a and c"),
            (std::vector<std::string>{"a", "c"}));
  EXPECT_TRUE(QuestionParser::answerKey("Answer the following questions").empty());
  EXPECT_TRUE(QuestionParser::answerKey("(a) Paris").empty());
}

TEST(QuestionParserTest, InlineOptionsOnOneLine) {
  std::vector<QuestionOption> options =
      QuestionParser::optionsOnLine("(a) 30   (b) 35 (c) 40");
  ASSERT_EQ(options.size(), 3u);
  EXPECT_EQ(options[0], (QuestionOption{'a', "30"}));
  EXPECT_EQ(options[1], (QuestionOption{'b', "35"}));
  EXPECT_EQ(options[2], (QuestionOption{'c', "40"}));

  EXPECT_TRUE(QuestionParser::optionsOnLine("No options here").empty());
}

TEST(QuestionParserTest, SplitPageIntoQuestionBlocks) {
  QuestionParser parser;
  std::vector<std::string> blocks = parser.splitQuestionBlocks(
      "Section A\n"
      "Answer all questions.\n"
      "1. First question?\n"
      "(a) yes (b) no\n"
      "\n"
      "2. Second question?\n"
      "(a) up (b) down\n");

  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(blocks[0], "1. First question?\n(a) yes (b) no");
  EXPECT_EQ(blocks[1], "2. Second question?\n(a) up (b) down");
}

TEST(QuestionParserTest, PageWithoutNumberedLinesHasNoBlocks) {
  QuestionParser parser;
  EXPECT_TRUE(parser.splitQuestionBlocks("Instructions only\nNo questions").empty());
}

TEST(QuestionTypeClassifierTest, MultipleChoice) {
  QuestionTypeClassifier classifier;
  auto result = classifier.classify(
      "Which of the following is a prime number?",
      {{'a', "4"}, {'b', "6"}, {'c', "7"}, {'d', "9"}});
  EXPECT_EQ(result.first, QuestionType::MCQ);
  EXPECT_GE(result.second, 0.8);
}

TEST(QuestionTypeClassifierTest, TrueFalse) {
  QuestionTypeClassifier classifier;
  EXPECT_EQ(classifier.classify("True or False: the sun is a star.", {}).first,
            QuestionType::TrueFalse);
  EXPECT_EQ(classifier
                .classify("The sun is a star.", {{'a', "True"}, {'b', "False"}})
                .first,
            QuestionType::TrueFalse);
}

TEST(QuestionTypeClassifierTest, FillInTheBlank) {
  QuestionTypeClassifier classifier;
  EXPECT_EQ(classifier.classify("The capital of France is ____.", {}).first,
            QuestionType::FillBlank);
}

TEST(QuestionTypeClassifierTest, Essay) {
  QuestionTypeClassifier classifier;
  auto result = classifier.classify("Explain the causes of the First World War.", {});
  EXPECT_EQ(result.first, QuestionType::Essay);
  EXPECT_GE(result.second, 0.8);
}

TEST(QuestionTypeClassifierTest, MultiSelect) {
  QuestionTypeClassifier classifier;
  EXPECT_EQ(classifier
                .classify("Select all that apply: prime numbers",
                          {{'a', "2"}, {'b', "3"}, {'c', "4"}})
                .first,
            QuestionType::MultiSelect);
}

TEST(QuestionTypeClassifierTest, EmptyTextIsUnknown) {
  QuestionTypeClassifier classifier;
  auto result = classifier.classify("   ", {});
  EXPECT_EQ(result.first, QuestionType::Unknown);
  EXPECT_DOUBLE_EQ(result.second, 0.0);
}

} // anonymous namespace

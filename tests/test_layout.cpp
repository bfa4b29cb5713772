#include "FakeEngine.hpp"
#include "LayoutAnalysis.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

using namespace exam;
using test_support::word;

TextLine line(const std::string &text, int x, int y, int width = 150,
              int height = 20) {
  TextLine l;
  l.text = text;
  l.x = x;
  l.y = y;
  l.width = width;
  l.height = height;
  l.confidence = 90.0;
  return l;
}

TEST(LayoutAnalysisTest, FilterKeepsReliableWordsAndStructuralTokens) {
  std::vector<OCRWord> words = {
      word("hello", 0, 0, 40, 20, 80.0),   // kept
      word("noise", 0, 0, 40, 20, 20.0),   // low confidence
      word("x", 0, 0, 10, 20, 95.0),       // single character
      word("(b)", 0, 0, 20, 20, 10.0),     // option marker
      word("12.", 0, 0, 20, 20, 15.0),     // question number
      word("Q3", 0, 0, 20, 20, 5.0),       // question number
      word("empty", 0, 0, 0, 0, 95.0),     // no box
  };

  std::vector<OCRWord> kept = filterWords(words, 30.0);
  ASSERT_EQ(kept.size(), 4u);
  EXPECT_EQ(kept[0].text, "hello");
  EXPECT_EQ(kept[1].text, "(b)");
  EXPECT_EQ(kept[2].text, "12.");
  EXPECT_EQ(kept[3].text, "Q3");
}

TEST(LayoutAnalysisTest, RowsSplitOnWideGaps) {
  std::vector<OCRWord> words = {
      word("Right", 200, 2, 50),
      word("Left", 0, 0, 50),
      word("side", 55, 0, 40),
      word("Next", 0, 50, 50),
  };

  std::vector<TextLine> lines = buildTextLines(words);
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0].text, "Left side");
  EXPECT_EQ(lines[0].x, 0);
  EXPECT_EQ(lines[0].width, 95);
  EXPECT_EQ(lines[1].text, "Right");
  EXPECT_EQ(lines[1].x, 200);
  EXPECT_EQ(lines[2].text, "Next");
  EXPECT_EQ(lines[2].y, 50);
}

TEST(LayoutAnalysisTest, LineConfidenceIsWordMean) {
  std::vector<OCRWord> words = {word("alpha", 0, 0, 40, 20, 80.0),
                                word("beta", 45, 0, 40, 20, 60.0)};
  std::vector<TextLine> lines = buildTextLines(words);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_DOUBLE_EQ(lines[0].confidence, 70.0);
}

TEST(LayoutAnalysisTest, QuestionWordsFormFourLines) {
  std::vector<TextLine> lines = buildTextLines(test_support::franceQuestionWords());
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_EQ(lines[0].text, "1. What is the capital of France?");
  EXPECT_EQ(lines[1].text, "(a) Paris (b) London");
  EXPECT_EQ(lines[2].text, "(c) Berlin (d) Madrid");
  EXPECT_EQ(lines[3].text, "Answer: (a)");
}

TEST(LayoutAnalysisTest, TwoColumns) {
  std::vector<TextLine> lines = {
      line("1. Left", 20, 40),  line("(a) one", 30, 80),
      line("2. Right", 420, 40), line("(a) two", 430, 80),
  };

  std::vector<Column> columns = detectColumns(lines);
  ASSERT_EQ(columns.size(), 2u);
  EXPECT_EQ(columns[0].left, 20);
  EXPECT_EQ(columns[0].lines.size(), 2u);
  EXPECT_EQ(columns[1].left, 420);
  EXPECT_EQ(columns[1].right, 580);
  EXPECT_EQ(columns[1].lines.size(), 2u);
}

TEST(LayoutAnalysisTest, IndentedLinesStayInOneColumn) {
  std::vector<TextLine> lines = {line("1. Question", 20, 40),
                                 line("(a) one", 30, 80),
                                 line("(b) two", 50, 120)};

  std::vector<Column> columns = detectColumns(lines);
  ASSERT_EQ(columns.size(), 1u);
  EXPECT_EQ(columns[0].lines.size(), 3u);
  EXPECT_EQ(columns[0].left, 20);
}

TEST(LayoutAnalysisTest, ModerateGapIsNotAColumnBreak) {
  // 90 px gap is a candidate but below the significance threshold
  std::vector<TextLine> lines = {line("left", 20, 40), line("right", 110, 80)};
  EXPECT_EQ(detectColumns(lines).size(), 1u);
}

TEST(LayoutAnalysisTest, NoLinesNoColumns) {
  EXPECT_TRUE(detectColumns({}).empty());
}

} // anonymous namespace

#ifndef EXAM_LAYOUT_ANALYSIS_HPP
#define EXAM_LAYOUT_ANALYSIS_HPP

#include "OCREngine.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace exam {

/**
 * @brief A row of OCR words read left to right
 */
struct TextLine {
  std::string text;
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
  double confidence = 0.0; ///< Mean word confidence (0-100)

  int x2() const { return x + width; }
  int y2() const { return y + height; }
  cv::Rect rect() const { return {x, y, width, height}; }
};

/**
 * @brief Word filtering and line building parameters
 */
struct LineBuilderConfig {
  double minWordConfidence = 30.0; ///< Words at or below are dropped
  int maxWordGap = 40;             ///< Horizontal gap that splits a row
};

/**
 * @brief Column split parameters
 */
struct ColumnConfig {
  int minColumnGap = 80;          ///< Gaps above this are column candidates
  int significantColumnGap = 100; ///< Largest gap needed to declare 2 columns
  int breakOffset = 40;           ///< Break x = gap start + offset
};

/**
 * @brief Lines sharing one page column
 */
struct Column {
  int left = 0;  ///< Smallest line x in the column
  int right = 0; ///< Largest line x2 in the column
  std::vector<TextLine> lines;
};

/**
 * @brief Drop unreliable words
 *
 * Words with confidence at or below the threshold, or with a single
 * character, are removed unless they look like a question number or an
 * option marker.
 */
std::vector<OCRWord> filterWords(const std::vector<OCRWord> &words,
                                 double minConfidence);

/**
 * @brief Group words into lines
 *
 * Words whose vertical centers fall into the same band form a row; a row
 * is split wherever the horizontal gap between neighbours exceeds
 * maxWordGap, so text of side-by-side columns never shares a line.
 * @return Lines sorted top to bottom, then left to right
 */
std::vector<TextLine> buildTextLines(const std::vector<OCRWord> &words,
                                     const LineBuilderConfig &config =
                                         LineBuilderConfig());

/**
 * @brief Split lines into one or two columns by line start positions
 */
std::vector<Column> detectColumns(const std::vector<TextLine> &lines,
                                  const ColumnConfig &config = ColumnConfig());

} // namespace exam

#endif // EXAM_LAYOUT_ANALYSIS_HPP

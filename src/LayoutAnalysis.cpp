#include "LayoutAnalysis.hpp"

#include <algorithm>
#include <iterator>
#include <regex>
#include <set>

namespace exam {

namespace {

bool isStructuralToken(const std::string &text) {
  // "12." "12)" "Q3" "(b)" "b)"
  static const std::regex token(R"(^(\d+[.):]?|Q\.?\d+[.:]?|\(?[a-dA-D]\)[.,]?)$)");
  return std::regex_match(text, token);
}

int centerY(const cv::Rect &box) { return box.y + box.height / 2; }

TextLine makeLine(const std::vector<OCRWord> &words) {
  TextLine line;
  cv::Rect bounds = words.front().boundingBox;
  double confidenceSum = 0.0;

  for (std::size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      line.text += ' ';
      bounds |= words[i].boundingBox;
    }
    line.text += words[i].text;
    confidenceSum += words[i].confidence;
  }

  line.x = bounds.x;
  line.y = bounds.y;
  line.width = bounds.width;
  line.height = bounds.height;
  line.confidence = confidenceSum / words.size();
  return line;
}

} // anonymous namespace

std::vector<OCRWord> filterWords(const std::vector<OCRWord> &words,
                                 double minConfidence) {
  std::vector<OCRWord> kept;
  for (const auto &word : words) {
    if (word.text.empty() || word.boundingBox.area() <= 0) {
      continue;
    }
    bool reliable = word.confidence > minConfidence && word.text.size() > 1;
    if (reliable || isStructuralToken(word.text)) {
      kept.push_back(word);
    }
  }
  return kept;
}

std::vector<TextLine> buildTextLines(const std::vector<OCRWord> &words,
                                     const LineBuilderConfig &config) {
  std::vector<OCRWord> kept = filterWords(words, config.minWordConfidence);
  std::sort(kept.begin(), kept.end(), [](const OCRWord &a, const OCRWord &b) {
    return centerY(a.boundingBox) < centerY(b.boundingBox);
  });

  // Rows: words whose vertical centre falls inside the row's band
  std::vector<std::vector<OCRWord>> rows;
  cv::Rect band;
  for (const auto &word : kept) {
    int cy = centerY(word.boundingBox);
    if (!rows.empty() && cy >= band.y && cy <= band.y + band.height) {
      rows.back().push_back(word);
      band |= word.boundingBox;
      continue;
    }
    rows.push_back({word});
    band = word.boundingBox;
  }

  std::vector<TextLine> lines;
  for (auto &row : rows) {
    std::sort(row.begin(), row.end(), [](const OCRWord &a, const OCRWord &b) {
      return a.boundingBox.x < b.boundingBox.x;
    });

    std::vector<OCRWord> segment;
    for (const auto &word : row) {
      if (!segment.empty()) {
        const cv::Rect &prev = segment.back().boundingBox;
        if (word.boundingBox.x - (prev.x + prev.width) > config.maxWordGap) {
          lines.push_back(makeLine(segment));
          segment.clear();
        }
      }
      segment.push_back(word);
    }
    if (!segment.empty()) {
      lines.push_back(makeLine(segment));
    }
  }

  std::sort(lines.begin(), lines.end(),
            [](const TextLine &a, const TextLine &b) {
              if (a.y != b.y) {
                return a.y < b.y;
              }
              return a.x < b.x;
            });
  return lines;
}

std::vector<Column> detectColumns(const std::vector<TextLine> &lines,
                                  const ColumnConfig &config) {
  std::vector<Column> columns;
  if (lines.empty()) {
    return columns;
  }

  auto makeColumn = [](std::vector<TextLine> columnLines) {
    Column column;
    column.left = columnLines.front().x;
    column.right = columnLines.front().x2();
    for (const auto &line : columnLines) {
      column.left = std::min(column.left, line.x);
      column.right = std::max(column.right, line.x2());
    }
    column.lines = std::move(columnLines);
    return column;
  };

  std::set<int> starts;
  for (const auto &line : lines) {
    starts.insert(line.x);
  }

  int largestGap = 0;
  int gapStart = 0;
  for (auto it = starts.begin(); std::next(it) != starts.end(); ++it) {
    int gap = *std::next(it) - *it;
    if (gap > config.minColumnGap && gap > largestGap) {
      largestGap = gap;
      gapStart = *it;
    }
  }

  if (largestGap < config.significantColumnGap) {
    columns.push_back(makeColumn(lines));
    return columns;
  }

  int columnBreak = gapStart + config.breakOffset;
  std::vector<TextLine> left, right;
  for (const auto &line : lines) {
    (line.x < columnBreak ? left : right).push_back(line);
  }

  if (left.empty() || right.empty()) {
    columns.push_back(makeColumn(lines));
    return columns;
  }

  columns.push_back(makeColumn(std::move(left)));
  columns.push_back(makeColumn(std::move(right)));
  return columns;
}

} // namespace exam

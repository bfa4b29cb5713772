#include "QuestionDetector.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <iterator>
#include <regex>

namespace exam {

namespace {

const std::regex &questionPatterns(std::size_t index) {
  static const std::regex patterns[] = {
      std::regex(R"(^\s*(\d+)\.\s+)"),
      std::regex(R"(^\s*Q\.?\s*(\d+)[:.]?\s*)"),
      std::regex(R"(^\s*(\d+)\)\s*)"),
  };
  return patterns[index];
}

const std::regex kOptionStart(R"(^\s*\(([a-d])\)\s*\S)");
const std::regex kOptionMarker(R"(\(([a-d])\)\s*)");

cv::Rect clampToPage(const cv::Rect &box, const cv::Size &pageSize) {
  return box & cv::Rect(0, 0, pageSize.width, pageSize.height);
}

} // anonymous namespace

QuestionDetector::QuestionDetector(const QuestionDetectorConfig &config)
    : m_config(config) {}

std::optional<int>
QuestionDetector::matchQuestionStart(const std::string &text,
                                     std::size_t *prefixLength) {
  for (std::size_t i = 0; i < 3; ++i) {
    std::smatch match;
    if (std::regex_search(text, match, questionPatterns(i))) {
      if (prefixLength) {
        *prefixLength = static_cast<std::size_t>(match.length(0));
      }
      try {
        return std::stoi(match[1].str());
      } catch (const std::out_of_range &) {
        return std::nullopt;
      }
    }
  }
  return std::nullopt;
}

std::vector<QuestionOption>
QuestionDetector::matchOptions(const std::string &text) {
  std::vector<QuestionOption> options;
  if (!std::regex_search(text, kOptionStart)) {
    return options;
  }

  auto begin = std::sregex_iterator(text.begin(), text.end(), kOptionMarker);
  auto end = std::sregex_iterator();
  for (auto it = begin; it != end; ++it) {
    auto next = std::next(it);
    std::size_t textStart = it->position(0) + it->length(0);
    std::size_t textEnd =
        next != end ? static_cast<std::size_t>(next->position(0)) : text.size();

    QuestionOption option;
    option.letter = (*it)[1].str()[0];
    option.text = trim(text.substr(textStart, textEnd - textStart));
    options.push_back(option);
  }
  return options;
}

bool QuestionDetector::isValidOptionSequence(
    const std::vector<QuestionOption> &options) {
  if (options.size() > 4) {
    return false;
  }
  for (std::size_t i = 0; i < options.size(); ++i) {
    if (options[i].letter != static_cast<char>('a' + i)) {
      return false;
    }
  }
  return true;
}

std::vector<QuestionCandidate>
QuestionDetector::findQuestions(const std::vector<TextLine> &lines) const {
  std::vector<QuestionCandidate> questions;
  std::optional<QuestionCandidate> current;

  auto close = [&]() {
    if (current) {
      questions.push_back(std::move(*current));
      current.reset();
    }
  };

  for (const auto &line : lines) {
    std::size_t prefix = 0;
    if (auto number = matchQuestionStart(line.text, &prefix)) {
      close();
      current = QuestionCandidate();
      current->number = *number;
      current->lines.push_back(line);
      current->stem = trim(line.text.substr(prefix));
      continue;
    }

    if (!current) {
      continue;
    }

    // An option line or the line budget ends the stem
    if (!matchOptions(line.text).empty() ||
        static_cast<int>(current->lines.size()) >= m_config.maxQuestionLines) {
      close();
      continue;
    }

    current->lines.push_back(line);
    std::string continuation = trim(line.text);
    if (!continuation.empty()) {
      current->stem += current->stem.empty() ? continuation : " " + continuation;
    }
  }
  close();

  return questions;
}

std::vector<OptionCandidate>
QuestionDetector::findOptions(const std::vector<TextLine> &lines) const {
  std::vector<OptionCandidate> options;
  for (const auto &line : lines) {
    for (const auto &option : matchOptions(line.text)) {
      OptionCandidate candidate;
      candidate.letter = option.letter;
      candidate.text = option.text;
      candidate.line = line;
      options.push_back(std::move(candidate));
    }
  }
  return options;
}

double QuestionDetector::confidenceFor(std::size_t optionCount) const {
  double confidence = m_config.baseConfidence;
  if (optionCount >= 4) {
    confidence += 0.15;
  } else if (optionCount >= 2) {
    confidence += 0.10;
  }
  return std::min(confidence, m_config.maxConfidence);
}

StructuralResult QuestionDetector::groupColumn(const Column &column,
                                               int pageNumber,
                                               const cv::Size &pageSize) const {
  StructuralResult result;
  result.columnCount = 1;

  std::vector<QuestionCandidate> questions = findQuestions(column.lines);
  std::vector<OptionCandidate> options = findOptions(column.lines);

  int columnBottom = 0;
  for (const auto &line : column.lines) {
    columnBottom = std::max(columnBottom, line.y2());
  }

  for (std::size_t i = 0; i < questions.size(); ++i) {
    const QuestionCandidate &question = questions[i];

    int nextStart = INT_MAX;
    for (std::size_t j = 0; j < questions.size(); ++j) {
      if (j != i && questions[j].y() > question.endY()) {
        nextStart = std::min(nextStart, questions[j].y());
      }
    }

    std::vector<OptionCandidate> owned;
    for (const auto &option : options) {
      if (option.line.y >= question.endY() && option.line.y < nextStart &&
          std::abs(option.line.x - question.x()) < m_config.sameColumnTolerance) {
        owned.push_back(option);
      }
    }
    std::stable_sort(owned.begin(), owned.end(),
                     [](const OptionCandidate &a, const OptionCandidate &b) {
                       if (a.line.y != b.line.y) {
                         return a.line.y < b.line.y;
                       }
                       return a.line.x < b.line.x;
                     });

    std::vector<QuestionOption> groupOptions;
    for (const auto &option : owned) {
      groupOptions.push_back({option.letter, option.text});
    }

    if (!isValidOptionSequence(groupOptions)) {
      int bottom = nextStart != INT_MAX ? nextStart : columnBottom;
      cv::Rect area(column.left, question.y(), column.right - column.left,
                    std::max(bottom - question.y(), 1));
      area = clampToPage(area, pageSize);
      if (area.area() > 0) {
        result.rejectedAreas.push_back(area);
      }
      continue;
    }

    cv::Rect box = question.lines.front().rect();
    std::vector<std::string> textLines;
    for (const auto &line : question.lines) {
      box |= line.rect();
      textLines.push_back(line.text);
    }
    std::string lastLineText;
    for (const auto &option : owned) {
      box |= option.line.rect();
      // Several options can share a line
      if (option.line.text != lastLineText) {
        textLines.push_back(option.line.text);
        lastLineText = option.line.text;
      }
    }

    int pad = m_config.padding;
    box = clampToPage(
        cv::Rect(box.x - pad, box.y - pad, box.width + 2 * pad,
                 box.height + 2 * pad),
        pageSize);
    if (box.area() <= 0) {
      continue;
    }

    QuestionGroup group;
    group.region = Region::fromRect(box, pageNumber, RegionType::QuestionGroup,
                                    confidenceFor(groupOptions.size()));
    group.region.text = join(textLines, "\n");
    group.region.metadata["detection_method"] = "structural";
    group.region.metadata["question_number"] = std::to_string(question.number);
    group.region.metadata["option_count"] =
        std::to_string(groupOptions.size());
    group.questionNumber = question.number;
    group.questionText = question.stem;
    group.options = std::move(groupOptions);
    group.isComplete = group.options.size() >= 2;
    result.groups.push_back(std::move(group));
  }

  return result;
}

StructuralResult QuestionDetector::detect(const std::vector<TextLine> &lines,
                                          int pageNumber,
                                          const cv::Size &pageSize,
                                          const ColumnConfig &columns) const {
  StructuralResult result;
  std::vector<Column> detected = detectColumns(lines, columns);
  result.columnCount = static_cast<int>(detected.size());

  for (const auto &column : detected) {
    StructuralResult partial = groupColumn(column, pageNumber, pageSize);
    for (auto &group : partial.groups) {
      result.groups.push_back(std::move(group));
    }
    for (const auto &area : partial.rejectedAreas) {
      result.rejectedAreas.push_back(area);
    }
  }

  return result;
}

} // namespace exam

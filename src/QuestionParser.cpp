#include "QuestionParser.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <regex>
#include <sstream>

namespace exam {

namespace {

const std::regex::flag_type kIcase =
    std::regex::ECMAScript | std::regex::icase;

// Option markers "(a)" and "a)"; the option text runs to the next marker
// of the same form, so it may itself contain parentheses, e.g. "f(x) = 2"
const std::regex kParenMarker(R"(\(([a-d])\))", kIcase);
const std::regex kBareMarker(R"((?:^|\s)([a-d])\))", kIcase);

const std::regex kAnswerLine(
    R"(^\s*(?:correct\s+answer|answer|ans)\s*(?:[.:\-]|is\b)\s*(.*)$)", kIcase);
const std::regex kAnswerLetter(R"(\b([a-d])\b)", kIcase);

const std::regex kWhitespace(R"(\s+)");

const std::vector<std::regex> &numberPatterns() {
  static const std::vector<std::regex> patterns = {
      std::regex(R"(^\s*Question\s*(\d+)\s*[.:)]?\s*)", kIcase),
      std::regex(R"(^\s*Q\.?\s*(\d+)\s*[.:)]?\s*)"),
      std::regex(R"(^\s*(\d+)\s*[.:)]\s*)"),
      std::regex(R"(^\s*\((\d+)\)\s*)"),
      std::regex(R"(^\s*\[(\d+)\]\s*)"),
  };
  return patterns;
}

std::string cleanOptionText(const std::string &raw) {
  std::string text = trim(std::regex_replace(raw, kWhitespace, " "));
  while (!text.empty() && text.back() == ',') {
    text.pop_back();
  }
  return trim(text);
}

/**
 * Options on a line and the offset where the first option marker starts.
 */
std::vector<QuestionOption> findOptions(const std::string &line,
                                        std::size_t *firstMarker) {
  std::vector<QuestionOption> options;
  for (const std::regex *marker : {&kParenMarker, &kBareMarker}) {
    auto begin = std::sregex_iterator(line.begin(), line.end(), *marker);
    auto end = std::sregex_iterator();
    if (begin == end) {
      continue;
    }
    if (firstMarker) {
      *firstMarker = static_cast<std::size_t>(begin->position(0));
    }
    for (auto it = begin; it != end; ++it) {
      auto next = std::next(it);
      std::size_t textStart = it->position(0) + it->length(0);
      std::size_t textEnd = next != end
                                ? static_cast<std::size_t>(next->position(0))
                                : line.size();
      std::string text =
          cleanOptionText(line.substr(textStart, textEnd - textStart));
      if (text.empty()) {
        continue;
      }
      QuestionOption option;
      option.letter = static_cast<char>(std::tolower((*it)[1].str()[0]));
      option.text = text;
      options.push_back(option);
    }
    break;
  }
  return options;
}

int countMatches(const std::vector<std::regex> &patterns,
                 const std::string &text) {
  return static_cast<int>(std::count_if(
      patterns.begin(), patterns.end(),
      [&text](const std::regex &p) { return std::regex_search(text, p); }));
}

} // anonymous namespace

std::optional<int> QuestionParser::questionNumber(const std::string &line,
                                                  std::size_t *prefixLength) {
  for (const auto &pattern : numberPatterns()) {
    std::smatch match;
    if (std::regex_search(line, match, pattern)) {
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
QuestionParser::optionsOnLine(const std::string &line) {
  return findOptions(line, nullptr);
}

std::vector<std::string> QuestionParser::answerKey(const std::string &line) {
  std::vector<std::string> letters;
  std::smatch match;
  if (!std::regex_match(line, match, kAnswerLine)) {
    return letters;
  }

  const std::string rest = match[1].str();
  auto begin = std::sregex_iterator(rest.begin(), rest.end(), kAnswerLetter);
  for (auto it = begin; it != std::sregex_iterator(); ++it) {
    std::string letter = toLower((*it)[1].str());
    if (std::find(letters.begin(), letters.end(), letter) == letters.end()) {
      letters.push_back(letter);
    }
  }
  return letters;
}

ParsedQuestion QuestionParser::parse(const std::string &text) const {
  ParsedQuestion parsed;
  std::vector<std::string> stemLines;
  std::map<char, std::string> options;

  for (const auto &rawLine : splitLines(text)) {
    std::string line = trim(rawLine);
    if (line.empty()) {
      continue;
    }

    std::vector<std::string> answers = answerKey(line);
    if (!answers.empty()) {
      for (const auto &letter : answers) {
        if (std::find(parsed.correctAnswers.begin(),
                      parsed.correctAnswers.end(),
                      letter) == parsed.correctAnswers.end()) {
          parsed.correctAnswers.push_back(letter);
        }
      }
      continue;
    }

    if (stemLines.empty() && options.empty() && !parsed.questionNumber) {
      std::size_t prefix = 0;
      if (auto number = questionNumber(line, &prefix)) {
        parsed.questionNumber = number;
        line = trim(line.substr(prefix));
        if (line.empty()) {
          continue;
        }
      }
    }

    std::size_t firstMarker = 0;
    std::vector<QuestionOption> lineOptions = findOptions(line, &firstMarker);
    if (lineOptions.empty()) {
      stemLines.push_back(line);
      continue;
    }

    // Stem text in front of inline options
    std::string lead = trim(line.substr(0, firstMarker));
    if (!lead.empty() && options.empty()) {
      stemLines.push_back(lead);
    }
    for (const auto &option : lineOptions) {
      options.emplace(option.letter, option.text);
    }
  }

  parsed.questionText = join(stemLines, " ");
  for (const auto &entry : options) {
    parsed.options.push_back({entry.first, entry.second});
  }
  return parsed;
}

std::vector<std::string>
QuestionParser::splitQuestionBlocks(const std::string &pageText) const {
  std::vector<std::string> blocks;
  std::vector<std::string> current;
  bool inQuestion = false;

  for (const auto &rawLine : splitLines(pageText)) {
    std::string line = trim(rawLine);
    if (line.empty()) {
      continue;
    }

    if (questionNumber(line)) {
      if (inQuestion && !current.empty()) {
        blocks.push_back(join(current, "\n"));
      }
      current = {line};
      inQuestion = true;
    } else if (inQuestion) {
      current.push_back(line);
    }
  }

  if (inQuestion && !current.empty()) {
    blocks.push_back(join(current, "\n"));
  }
  return blocks;
}

std::pair<QuestionType, double>
QuestionTypeClassifier::classify(const std::string &questionText,
                                 const std::vector<QuestionOption> &options) const {
  static const std::vector<std::regex> mcqPatterns = {
      std::regex(R"(choose\s+(?:the\s+)?(?:correct|best|most\s+appropriate))"),
      std::regex(R"(which\s+(?:of\s+)?(?:the\s+)?following)"),
      std::regex(R"(select\s+(?:the\s+)?(?:correct|best))"),
  };
  static const std::vector<std::regex> trueFalsePatterns = {
      std::regex(R"(true\s*(?:or|/)\s*false)"),
      std::regex(R"(state\s+(?:whether\s+)?true\s+or\s+false)"),
      std::regex(R"(mark\s+as\s+true\s+or\s+false)"),
      std::regex(R"(indicate\s+(?:whether\s+)?true\s+or\s+false)"),
  };
  static const std::vector<std::regex> fillBlankPatterns = {
      std::regex(R"(_{2,})"),
      std::regex(R"(\[\s*blank\s*\])", kIcase),
      std::regex(R"(fill\s+in\s+the\s+blank)", kIcase),
      std::regex(R"(complete\s+the\s+(?:following\s+)?(?:sentence|statement))",
                 kIcase),
      std::regex(R"(\.{3,})"),
  };
  static const std::vector<std::regex> essayPatterns = {
      std::regex(R"(\b(?:explain|describe|discuss|analy[sz]e|evaluate|compare|contrast)\b)"),
      std::regex(R"(write\s+(?:a\s+)?(?:short\s+)?(?:note|essay|paragraph))"),
      std::regex(R"(what\s+(?:is|are|was|were)\s+(?:the\s+)?(?:importance|significance|effects?|causes?))"),
      std::regex(R"(\b(?:how|why)\s+(?:does?|did|is|are|was|were)\b)"),
      std::regex(R"(give\s+(?:your\s+)?(?:opinion|views?))"),
      std::regex(R"(\b(?:elaborate|justify|summari[sz]e|outline)\b)"),
  };
  static const std::vector<std::regex> multiSelectPatterns = {
      std::regex(R"(select\s+all\s+that\s+apply)"),
      std::regex(R"(choose\s+(?:all|multiple)\s+correct)"),
      std::regex(R"(mark\s+all\s+(?:that\s+)?(?:are\s+)?correct)"),
      std::regex(R"((?:tick|check)\s+all\s+(?:that\s+)?apply)"),
      std::regex(R"(which\s+of\s+the\s+following\s+are)"),
  };

  std::string original = trim(questionText);
  if (original.empty()) {
    return {QuestionType::Unknown, 0.0};
  }
  std::string text = toLower(original);

  std::map<QuestionType, double> scores = {
      {QuestionType::MCQ, 0.0},       {QuestionType::MultiSelect, 0.0},
      {QuestionType::TrueFalse, 0.0}, {QuestionType::FillBlank, 0.0},
      {QuestionType::Essay, 0.0},
  };

  scores[QuestionType::MultiSelect] += 3.0 * countMatches(multiSelectPatterns, text);
  scores[QuestionType::TrueFalse] += 2.5 * countMatches(trueFalsePatterns, text);

  if (options.size() == 2) {
    bool hasTrue = false, hasFalse = false;
    for (const auto &option : options) {
      std::string optionText = toLower(option.text);
      hasTrue = hasTrue || optionText.find("true") != std::string::npos;
      hasFalse = hasFalse || optionText.find("false") != std::string::npos;
    }
    if (hasTrue && hasFalse) {
      scores[QuestionType::TrueFalse] += 3.0;
    }
  }

  // Blanks are matched on the original text
  scores[QuestionType::FillBlank] += 2.0 * countMatches(fillBlankPatterns, original);

  scores[QuestionType::MCQ] += 1.5 * countMatches(mcqPatterns, text);
  if (options.size() >= 3) {
    scores[QuestionType::MCQ] += 2.0;
    if (options.size() >= 4) {
      scores[QuestionType::MCQ] += 1.0;
    }
  }

  scores[QuestionType::Essay] += 1.5 * countMatches(essayPatterns, text);

  std::istringstream words(text);
  std::vector<std::string> tokens{std::istream_iterator<std::string>(words),
                                  std::istream_iterator<std::string>()};
  if (tokens.size() > 20 && options.empty()) {
    scores[QuestionType::Essay] += 1.0;
  }
  if (tokens.size() < 15 && scores[QuestionType::FillBlank] > 0) {
    scores[QuestionType::FillBlank] += 1.0;
  }
  static const std::vector<std::string> commandVerbs = {
      "explain", "describe", "discuss", "analyze", "evaluate", "write"};
  if (!tokens.empty() &&
      std::find(commandVerbs.begin(), commandVerbs.end(), tokens.front()) !=
          commandVerbs.end()) {
    scores[QuestionType::Essay] += 2.0;
  }

  auto best = std::max_element(
      scores.begin(), scores.end(),
      [](const auto &a, const auto &b) { return a.second < b.second; });
  if (best->second <= 0.0) {
    return {QuestionType::Unknown, 0.0};
  }

  double confidence = std::min(best->second / 5.0, 1.0);
  if (best->second >= 3.0) {
    confidence = std::max(confidence, 0.8);
  } else if (best->second >= 2.0) {
    confidence = std::max(confidence, 0.6);
  }
  return {best->first, confidence};
}

} // namespace exam

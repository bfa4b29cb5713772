#include "ConfidenceAggregator.hpp"

#include <algorithm>

namespace exam {

std::string questionTypeToString(QuestionType type) {
  switch (type) {
  case QuestionType::MCQ:
    return "mcq";
  case QuestionType::MultiSelect:
    return "multi_select";
  case QuestionType::TrueFalse:
    return "true_false";
  case QuestionType::FillBlank:
    return "fill_blank";
  case QuestionType::Essay:
    return "essay";
  case QuestionType::Unknown:
    break;
  }
  return "unknown";
}

std::string confidenceLevelToString(ConfidenceLevel level) {
  switch (level) {
  case ConfidenceLevel::High:
    return "high";
  case ConfidenceLevel::Medium:
    return "medium";
  case ConfidenceLevel::Low:
    break;
  }
  return "low";
}

ConfidenceLevel confidenceLevelFor(double score) {
  if (score >= 80.0) {
    return ConfidenceLevel::High;
  }
  if (score >= 60.0) {
    return ConfidenceLevel::Medium;
  }
  return ConfidenceLevel::Low;
}

void applyConfidence(ExtractedQuestion &question, double score) {
  question.confidenceScore = std::clamp(score, 0.0, 100.0);
  question.confidenceLevel = confidenceLevelFor(question.confidenceScore);
  question.requiresReview = question.confidenceLevel == ConfidenceLevel::Low;
}

DocumentStatistics
ConfidenceAggregator::compute(const std::vector<ExtractedQuestion> &questions) {
  DocumentStatistics stats;
  double sum = 0.0;

  for (const auto &question : questions) {
    ++stats.total;
    sum += question.confidenceScore;

    switch (confidenceLevelFor(question.confidenceScore)) {
    case ConfidenceLevel::High:
      ++stats.high;
      break;
    case ConfidenceLevel::Medium:
      ++stats.medium;
      break;
    case ConfidenceLevel::Low:
      ++stats.low;
      break;
    }

    ++stats.byQuestionType[questionTypeToString(question.questionType)];
  }

  stats.needsReviewCount = stats.low;
  if (stats.total > 0) {
    stats.averageConfidence = sum / stats.total;
  }
  return stats;
}

double ConfidenceAggregator::scoreQuestion(double detectionConfidence,
                                           std::optional<double> ocrConfidence) {
  double score = 100.0 * std::clamp(detectionConfidence, 0.0, 1.0);
  if (ocrConfidence) {
    score = 0.6 * score + 0.4 * std::clamp(*ocrConfidence, 0.0, 100.0);
  }
  return score;
}

} // namespace exam

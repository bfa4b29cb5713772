#include "JsonExport.hpp"
#include "TextUtils.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace exam {

namespace {

using Allocator = rapidjson::Document::AllocatorType;

rapidjson::Value str(const std::string &text, Allocator &allocator) {
  return rapidjson::Value(text.c_str(),
                          static_cast<rapidjson::SizeType>(text.size()),
                          allocator);
}

std::string serialize(const rapidjson::Document &doc, bool pretty) {
  rapidjson::StringBuffer buffer;
  if (pretty) {
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);
  } else {
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
  }
  return std::string(buffer.GetString(), buffer.GetSize());
}

rapidjson::Value stringMap(const std::map<std::string, std::string> &values,
                           Allocator &allocator) {
  rapidjson::Value object(rapidjson::kObjectType);
  for (const auto &entry : values) {
    object.AddMember(str(entry.first, allocator), str(entry.second, allocator),
                     allocator);
  }
  return object;
}

int requireInt(const rapidjson::Value &item, const char *name,
               rapidjson::SizeType index) {
  if (!item.HasMember(name) || !item[name].IsInt()) {
    throw std::invalid_argument("Manual region " + std::to_string(index) +
                                ": missing integer field '" + name + "'");
  }
  return item[name].GetInt();
}

} // anonymous namespace

std::string regionsToJson(const std::vector<Region> &regions, bool pretty) {
  rapidjson::Document doc(rapidjson::kArrayType);
  Allocator &allocator = doc.GetAllocator();

  for (const auto &region : regions) {
    rapidjson::Value item(rapidjson::kObjectType);
    item.AddMember("id", str(region.id(), allocator), allocator);
    item.AddMember("type", str(regionTypeToString(region.type), allocator),
                   allocator);
    item.AddMember("page_number", region.pageNumber, allocator);

    rapidjson::Value coordinates(rapidjson::kObjectType);
    coordinates.AddMember("x", region.x, allocator);
    coordinates.AddMember("y", region.y, allocator);
    coordinates.AddMember("width", region.width, allocator);
    coordinates.AddMember("height", region.height, allocator);
    item.AddMember("coordinates", coordinates, allocator);

    item.AddMember("confidence", region.confidence, allocator);
    item.AddMember("text_preview",
                   str(truncateUtf8(region.text, kTextPreviewLength), allocator),
                   allocator);
    item.AddMember("needs_review", region.confidence < kRegionReviewThreshold,
                   allocator);
    doc.PushBack(item, allocator);
  }
  return serialize(doc, pretty);
}

std::string questionsToJson(const std::vector<ExtractedQuestion> &questions,
                            bool pretty) {
  rapidjson::Document doc(rapidjson::kArrayType);
  Allocator &allocator = doc.GetAllocator();

  for (const auto &question : questions) {
    rapidjson::Value item(rapidjson::kObjectType);
    if (question.questionNumber) {
      item.AddMember("question_number", *question.questionNumber, allocator);
    }
    item.AddMember("question_text", str(question.questionText, allocator),
                   allocator);
    item.AddMember("question_type",
                   str(questionTypeToString(question.questionType), allocator),
                   allocator);

    rapidjson::Value options(rapidjson::kArrayType);
    for (const auto &option : question.options) {
      rapidjson::Value entry(rapidjson::kObjectType);
      entry.AddMember("letter", str(std::string(1, option.letter), allocator),
                      allocator);
      entry.AddMember("text", str(option.text, allocator), allocator);
      options.PushBack(entry, allocator);
    }
    item.AddMember("options", options, allocator);

    rapidjson::Value answers(rapidjson::kArrayType);
    for (const auto &answer : question.correctAnswers) {
      answers.PushBack(str(answer, allocator), allocator);
    }
    item.AddMember("correct_answers", answers, allocator);

    item.AddMember("confidence_score", question.confidenceScore, allocator);
    item.AddMember("confidence_level",
                   str(confidenceLevelToString(question.confidenceLevel), allocator),
                   allocator);
    item.AddMember("requires_review", question.requiresReview, allocator);
    item.AddMember("page_number", question.pageNumber, allocator);
    item.AddMember("extraction_method", str(question.extractionMethod, allocator),
                   allocator);
    doc.PushBack(item, allocator);
  }
  return serialize(doc, pretty);
}

std::string snapshotToJson(const JobSnapshot &snapshot, bool pretty) {
  rapidjson::Document doc(rapidjson::kObjectType);
  Allocator &allocator = doc.GetAllocator();

  doc.AddMember("job_id", str(snapshot.jobId, allocator), allocator);
  doc.AddMember("document_id", str(snapshot.documentId, allocator), allocator);
  doc.AddMember("status", str(jobStatusToString(snapshot.status), allocator),
                allocator);
  doc.AddMember("current_step", str(snapshot.currentStep, allocator), allocator);
  doc.AddMember("current_step_display",
                str(snapshot.currentStepDisplay, allocator), allocator);
  doc.AddMember("progress_percentage", snapshot.progressPercentage, allocator);

  if (snapshot.error) {
    const ErrorRecord &error = *snapshot.error;
    rapidjson::Value details(rapidjson::kObjectType);
    details.AddMember("error", str(error.message, allocator), allocator);
    details.AddMember("error_type", str(error.type, allocator), allocator);
    details.AddMember("error_code", str(error.code, allocator), allocator);
    details.AddMember("step", str(error.step, allocator), allocator);
    details.AddMember("timestamp", str(error.timestamp, allocator), allocator);
    details.AddMember("trace", str(error.trace, allocator), allocator);
    details.AddMember("details", stringMap(error.details, allocator), allocator);
    doc.AddMember("error_details", details, allocator);
  }
  return serialize(doc, pretty);
}

std::string statisticsToJson(const DocumentStatistics &statistics, bool pretty) {
  rapidjson::Document doc(rapidjson::kObjectType);
  Allocator &allocator = doc.GetAllocator();

  doc.AddMember("total_questions", static_cast<uint64_t>(statistics.total),
                allocator);
  doc.AddMember("high_confidence", static_cast<uint64_t>(statistics.high),
                allocator);
  doc.AddMember("medium_confidence", static_cast<uint64_t>(statistics.medium),
                allocator);
  doc.AddMember("low_confidence", static_cast<uint64_t>(statistics.low),
                allocator);
  doc.AddMember("average_confidence", statistics.averageConfidence, allocator);
  doc.AddMember("needs_review_count",
                static_cast<uint64_t>(statistics.needsReviewCount), allocator);

  rapidjson::Value byType(rapidjson::kObjectType);
  for (const auto &entry : statistics.byQuestionType) {
    rapidjson::Value name = str(entry.first, allocator);
    byType.AddMember(name, static_cast<uint64_t>(entry.second), allocator);
  }
  doc.AddMember("question_types", byType, allocator);
  return serialize(doc, pretty);
}

std::vector<ManualRegionSpec> parseManualRegions(const std::string &json) {
  rapidjson::Document doc;
  doc.Parse(json.c_str(), json.size());
  if (doc.HasParseError()) {
    throw std::invalid_argument(
        std::string("Invalid manual region JSON at offset ") +
        std::to_string(doc.GetErrorOffset()) + ": " +
        rapidjson::GetParseError_En(doc.GetParseError()));
  }
  if (!doc.IsArray()) {
    throw std::invalid_argument("Manual regions must be a JSON array");
  }

  std::vector<ManualRegionSpec> specs;
  for (rapidjson::SizeType i = 0; i < doc.Size(); ++i) {
    const rapidjson::Value &item = doc[i];
    if (!item.IsObject()) {
      throw std::invalid_argument("Manual region " + std::to_string(i) +
                                  " is not an object");
    }

    ManualRegionSpec spec;
    spec.pageNumber = requireInt(item, "page", i);
    spec.box = cv::Rect(requireInt(item, "x", i), requireInt(item, "y", i),
                        requireInt(item, "width", i),
                        requireInt(item, "height", i));

    if (item.HasMember("type")) {
      if (!item["type"].IsString()) {
        throw std::invalid_argument("Manual region " + std::to_string(i) +
                                    ": 'type' must be a string");
      }
      spec.type = regionTypeFromString(item["type"].GetString());
    }

    if (spec.pageNumber < 1 || spec.box.width <= 0 || spec.box.height <= 0 ||
        spec.box.x < 0 || spec.box.y < 0) {
      throw std::invalid_argument("Manual region " + std::to_string(i) +
                                  " has invalid geometry");
    }
    specs.push_back(spec);
  }
  return specs;
}

std::string readTextFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open file: " + path);
  }
  std::ostringstream content;
  content << file.rdbuf();
  return content.str();
}

void writeTextFile(const std::string &path, const std::string &content) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw std::runtime_error("Cannot open file for writing: " + path);
  }
  file << content;
  if (!file) {
    throw std::runtime_error("Failed to write file: " + path);
  }
}

} // namespace exam

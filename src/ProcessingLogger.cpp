#include "ProcessingLogger.hpp"
#include "ProcessingErrors.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace exam {

ProcessingLogger::ProcessingLogger(std::string jobId, std::string documentId,
                                   std::ostream *out)
    : m_jobId(std::move(jobId)), m_documentId(std::move(documentId)),
      m_out(out) {}

void ProcessingLogger::logStepStart(const std::string &step,
                                    const Fields &details) {
  LogEvent event;
  event.event = "step_start";
  event.step = step;
  event.message = "Starting step: " + step;
  event.details = details;
  record(std::move(event));
}

void ProcessingLogger::logStepComplete(const std::string &step,
                                       double durationSeconds,
                                       const Fields &details) {
  LogEvent event;
  event.event = "step_complete";
  event.step = step;
  event.message = "Completed step: " + step;
  event.durationSeconds = durationSeconds;
  event.details = details;
  record(std::move(event));
}

void ProcessingLogger::logWarning(const std::string &message,
                                  const Fields &details) {
  LogEvent event;
  event.event = "warning";
  event.message = message;
  event.details = details;
  record(std::move(event));
}

void ProcessingLogger::logExtractionResult(int pageNumber, int questionsFound,
                                           double averageConfidence) {
  LogEvent event;
  event.event = "extraction_result";
  event.message = "Page " + std::to_string(pageNumber) + ": " +
                  std::to_string(questionsFound) + " questions";
  event.details["page_number"] = std::to_string(pageNumber);
  event.details["questions_found"] = std::to_string(questionsFound);
  event.details["confidence_avg"] = std::to_string(averageConfidence);
  record(std::move(event));
}

void ProcessingLogger::logPerformanceMetrics(const Fields &metrics) {
  LogEvent event;
  event.event = "performance_metrics";
  event.message = "Performance metrics";
  event.details = metrics;
  record(std::move(event));
}

std::vector<LogEvent> ProcessingLogger::events() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_events;
}

void ProcessingLogger::detachStream() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_out = nullptr;
}

std::string ProcessingLogger::toJsonLine(const LogEvent &event) {
  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

  writer.StartObject();
  writer.Key("event");
  writer.String(event.event.c_str());
  writer.Key("timestamp");
  writer.String(event.timestamp.c_str());
  writer.Key("job_id");
  writer.String(event.jobId.c_str());
  writer.Key("document_id");
  writer.String(event.documentId.c_str());
  if (!event.step.empty()) {
    writer.Key("step");
    writer.String(event.step.c_str());
  }
  writer.Key("message");
  writer.String(event.message.c_str());
  if (event.durationSeconds) {
    writer.Key("duration_seconds");
    writer.Double(*event.durationSeconds);
  }
  if (!event.details.empty()) {
    writer.Key("details");
    writer.StartObject();
    for (const auto &field : event.details) {
      writer.Key(field.first.c_str());
      writer.String(field.second.c_str());
    }
    writer.EndObject();
  }
  writer.EndObject();

  return buffer.GetString();
}

void ProcessingLogger::record(LogEvent event) {
  event.jobId = m_jobId;
  event.documentId = m_documentId;
  event.timestamp = isoTimestamp();

  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_out) {
    *m_out << toJsonLine(event) << '\n';
  }
  m_events.push_back(std::move(event));
}

} // namespace exam

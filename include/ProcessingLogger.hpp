#ifndef EXAM_PROCESSING_LOGGER_HPP
#define EXAM_PROCESSING_LOGGER_HPP

#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace exam {

/**
 * @brief One structured log event of a processing job
 */
struct LogEvent {
  std::string event;     ///< step_start, step_complete, warning, ...
  std::string jobId;
  std::string documentId;
  std::string timestamp; ///< ISO-8601 UTC
  std::string step;      ///< Step name, empty for job-level events
  std::string message;
  std::optional<double> durationSeconds;
  std::map<std::string, std::string> details;
};

/**
 * @brief Structured, per-job event logger
 *
 * Every event is written as one JSON line to the output stream (if any)
 * and kept in memory so callers and tests can inspect the run.
 */
class ProcessingLogger {
public:
  using Fields = std::map<std::string, std::string>;

  /**
   * @param jobId Job the events belong to
   * @param documentId Document being processed
   * @param out Stream receiving JSON lines; nullptr keeps events in memory
   */
  ProcessingLogger(std::string jobId, std::string documentId,
                   std::ostream *out = nullptr);

  void logStepStart(const std::string &step, const Fields &details = Fields());
  void logStepComplete(const std::string &step, double durationSeconds,
                       const Fields &details = Fields());
  void logWarning(const std::string &message, const Fields &details = Fields());
  void logExtractionResult(int pageNumber, int questionsFound,
                           double averageConfidence);
  void logPerformanceMetrics(const Fields &metrics);

  std::vector<LogEvent> events() const;

  /**
   * @brief Stop writing to the output stream
   *
   * Events recorded afterwards, e.g. by an abandoned step, are kept in
   * memory only. Returns once no write to the stream is in progress.
   */
  void detachStream();

  /**
   * @brief Serialize an event as a single-line JSON object
   */
  static std::string toJsonLine(const LogEvent &event);

private:
  void record(LogEvent event);

  std::string m_jobId;
  std::string m_documentId;
  std::ostream *m_out;
  mutable std::mutex m_mutex;
  std::vector<LogEvent> m_events;
};

} // namespace exam

#endif // EXAM_PROCESSING_LOGGER_HPP

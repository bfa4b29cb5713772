#ifndef EXAM_PROCESSING_ERRORS_HPP
#define EXAM_PROCESSING_ERRORS_HPP

#include <chrono>
#include <exception>
#include <map>
#include <stdexcept>
#include <string>

namespace exam {

using ErrorDetails = std::map<std::string, std::string>;

/**
 * @brief Category of a processing failure
 */
enum class ErrorKind {
  Generic,
  FileSecurity,
  OCRProcessing,
  TextExtraction,
  QuestionDetection,
  LayoutAnalysis,
  ProcessingTimeout
};

/**
 * @brief Stable error code of a kind, e.g. "OCR_PROCESSING_ERROR"
 */
const char *errorCodeFor(ErrorKind kind);

/**
 * @brief Class-style type name of a kind, e.g. "OCRProcessingError"
 */
const char *errorTypeName(ErrorKind kind);

/**
 * @brief Critical failures are reported to operators through the Notifier
 */
bool isCriticalKind(ErrorKind kind);

/**
 * @brief Format a time point as ISO-8601 UTC with milliseconds
 */
std::string isoTimestamp(
    std::chrono::system_clock::time_point time = std::chrono::system_clock::now());

/**
 * @brief Base class of all typed processing failures
 *
 * Carries a stable code and a details map in addition to the message.
 */
class ProcessingError : public std::runtime_error {
public:
  explicit ProcessingError(const std::string &message,
                           ErrorDetails details = ErrorDetails(),
                           std::string code = std::string());

  ErrorKind kind() const noexcept { return m_kind; }
  const std::string &code() const noexcept { return m_code; }
  const ErrorDetails &details() const noexcept { return m_details; }
  bool isCritical() const noexcept { return isCriticalKind(m_kind); }

protected:
  ProcessingError(ErrorKind kind, const std::string &message,
                  ErrorDetails details);

private:
  ErrorKind m_kind;
  std::string m_code;
  ErrorDetails m_details;
};

class FileSecurityError : public ProcessingError {
public:
  explicit FileSecurityError(const std::string &message,
                             ErrorDetails details = ErrorDetails())
      : ProcessingError(ErrorKind::FileSecurity, message, std::move(details)) {}
};

class OCRProcessingError : public ProcessingError {
public:
  explicit OCRProcessingError(const std::string &message,
                              ErrorDetails details = ErrorDetails())
      : ProcessingError(ErrorKind::OCRProcessing, message, std::move(details)) {
  }
};

class TextExtractionError : public ProcessingError {
public:
  explicit TextExtractionError(const std::string &message,
                               ErrorDetails details = ErrorDetails())
      : ProcessingError(ErrorKind::TextExtraction, message,
                        std::move(details)) {}
};

class QuestionDetectionError : public ProcessingError {
public:
  explicit QuestionDetectionError(const std::string &message,
                                  ErrorDetails details = ErrorDetails())
      : ProcessingError(ErrorKind::QuestionDetection, message,
                        std::move(details)) {}
};

class LayoutAnalysisError : public ProcessingError {
public:
  explicit LayoutAnalysisError(const std::string &message,
                               ErrorDetails details = ErrorDetails())
      : ProcessingError(ErrorKind::LayoutAnalysis, message,
                        std::move(details)) {}
};

class ProcessingTimeoutError : public ProcessingError {
public:
  explicit ProcessingTimeoutError(const std::string &message,
                                  ErrorDetails details = ErrorDetails())
      : ProcessingError(ErrorKind::ProcessingTimeout, message,
                        std::move(details)) {}
};

/**
 * @brief Serializable description of a failure, as stored on a job
 */
struct ErrorRecord {
  ErrorKind kind = ErrorKind::Generic;
  std::string code = "PROCESSING_ERROR"; ///< Stable error code
  std::string type = "ProcessingError";  ///< Error class name
  std::string message;                   ///< Human-readable message
  std::string step;                      ///< Step that failed, if any
  std::string timestamp;                 ///< ISO-8601 time of the failure
  std::string trace;                     ///< Diagnostic trace (<= 500 chars)
  ErrorDetails details;                  ///< Structured context
  bool critical = false;                 ///< Notify operators
};

/// Maximum length of ErrorRecord::trace
constexpr std::size_t kMaxTraceLength = 500;

/**
 * @brief Build a record from a typed error raised during @p step
 */
ErrorRecord makeErrorRecord(const ProcessingError &error,
                            const std::string &step = std::string());

/**
 * @brief Convert any in-flight exception into a typed error record
 *
 * ProcessingError subclasses keep their own kind. Any other exception is
 * reported as @p fallback, which is the most specific kind for the step
 * that raised it; the original exception type goes into the details.
 */
ErrorRecord wrapException(std::exception_ptr error, ErrorKind fallback,
                          const std::string &step = std::string());

} // namespace exam

#endif // EXAM_PROCESSING_ERRORS_HPP

#include "ProcessingErrors.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <typeinfo>

namespace exam {

const char *errorCodeFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::FileSecurity:
    return "FILE_SECURITY_ERROR";
  case ErrorKind::OCRProcessing:
    return "OCR_PROCESSING_ERROR";
  case ErrorKind::TextExtraction:
    return "TEXT_EXTRACTION_ERROR";
  case ErrorKind::QuestionDetection:
    return "QUESTION_DETECTION_ERROR";
  case ErrorKind::LayoutAnalysis:
    return "LAYOUT_ANALYSIS_ERROR";
  case ErrorKind::ProcessingTimeout:
    return "PROCESSING_TIMEOUT";
  case ErrorKind::Generic:
    break;
  }
  return "PROCESSING_ERROR";
}

const char *errorTypeName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::FileSecurity:
    return "FileSecurityError";
  case ErrorKind::OCRProcessing:
    return "OCRProcessingError";
  case ErrorKind::TextExtraction:
    return "TextExtractionError";
  case ErrorKind::QuestionDetection:
    return "QuestionDetectionError";
  case ErrorKind::LayoutAnalysis:
    return "LayoutAnalysisError";
  case ErrorKind::ProcessingTimeout:
    return "ProcessingTimeoutError";
  case ErrorKind::Generic:
    break;
  }
  return "ProcessingError";
}

bool isCriticalKind(ErrorKind kind) {
  return kind == ErrorKind::FileSecurity ||
         kind == ErrorKind::ProcessingTimeout;
}

std::string isoTimestamp(std::chrono::system_clock::time_point time) {
  auto seconds = std::chrono::system_clock::to_time_t(time);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    time.time_since_epoch())
                    .count() %
                1000;

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << millis << 'Z';
  return out.str();
}

ProcessingError::ProcessingError(const std::string &message,
                                 ErrorDetails details, std::string code)
    : std::runtime_error(message), m_kind(ErrorKind::Generic),
      m_code(code.empty() ? errorCodeFor(ErrorKind::Generic) : std::move(code)),
      m_details(std::move(details)) {}

ProcessingError::ProcessingError(ErrorKind kind, const std::string &message,
                                 ErrorDetails details)
    : std::runtime_error(message), m_kind(kind), m_code(errorCodeFor(kind)),
      m_details(std::move(details)) {}

namespace {

std::string truncateTrace(std::string trace) {
  if (trace.size() > kMaxTraceLength) {
    trace.resize(kMaxTraceLength);
  }
  return trace;
}

std::string buildTrace(const std::string &typeName, const std::string &message,
                       const std::string &step) {
  std::ostringstream trace;
  trace << typeName << ": " << message;
  if (!step.empty()) {
    trace << "\n  during step '" << step << "'";
  }
  return truncateTrace(trace.str());
}

ErrorRecord recordFor(ErrorKind kind, const std::string &message,
                      const ErrorDetails &details, const std::string &step) {
  ErrorRecord record;
  record.kind = kind;
  record.code = errorCodeFor(kind);
  record.type = errorTypeName(kind);
  record.message = message;
  record.step = step;
  record.timestamp = isoTimestamp();
  record.details = details;
  record.critical = isCriticalKind(kind);
  record.trace = buildTrace(record.type, message, step);
  return record;
}

} // anonymous namespace

ErrorRecord makeErrorRecord(const ProcessingError &error,
                            const std::string &step) {
  ErrorRecord record = recordFor(error.kind(), error.what(), error.details(),
                                 step);
  record.code = error.code();
  return record;
}

ErrorRecord wrapException(std::exception_ptr error, ErrorKind fallback,
                          const std::string &step) {
  try {
    std::rethrow_exception(error);
  } catch (const ProcessingError &e) {
    return makeErrorRecord(e, step);
  } catch (const std::exception &e) {
    ErrorDetails details;
    details["original_type"] = typeid(e).name();
    return recordFor(fallback, e.what(), details, step);
  } catch (...) {
    return recordFor(fallback, "Unknown exception", ErrorDetails(), step);
  }
}

} // namespace exam

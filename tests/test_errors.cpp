#include "ErrorHandler.hpp"
#include "ProcessingErrors.hpp"
#include "ProcessingJob.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <regex>
#include <stdexcept>
#include <vector>

namespace {

using namespace exam;

class RecordingNotifier : public Notifier {
public:
  void notifyCritical(const ErrorRecord &error, const JobSnapshot &job) override {
    errors.push_back(error);
    jobs.push_back(job);
  }

  std::vector<ErrorRecord> errors;
  std::vector<JobSnapshot> jobs;
};

TEST(ProcessingErrorsTest, CodesPerKind) {
  EXPECT_STREQ(errorCodeFor(ErrorKind::Generic), "PROCESSING_ERROR");
  EXPECT_STREQ(errorCodeFor(ErrorKind::FileSecurity), "FILE_SECURITY_ERROR");
  EXPECT_STREQ(errorCodeFor(ErrorKind::OCRProcessing), "OCR_PROCESSING_ERROR");
  EXPECT_STREQ(errorCodeFor(ErrorKind::TextExtraction), "TEXT_EXTRACTION_ERROR");
  EXPECT_STREQ(errorCodeFor(ErrorKind::QuestionDetection),
               "QUESTION_DETECTION_ERROR");
  EXPECT_STREQ(errorCodeFor(ErrorKind::LayoutAnalysis), "LAYOUT_ANALYSIS_ERROR");
  EXPECT_STREQ(errorCodeFor(ErrorKind::ProcessingTimeout), "PROCESSING_TIMEOUT");
}

TEST(ProcessingErrorsTest, OnlySecurityAndTimeoutAreCritical) {
  EXPECT_TRUE(isCriticalKind(ErrorKind::FileSecurity));
  EXPECT_TRUE(isCriticalKind(ErrorKind::ProcessingTimeout));
  EXPECT_FALSE(isCriticalKind(ErrorKind::OCRProcessing));
  EXPECT_FALSE(isCriticalKind(ErrorKind::Generic));
}

TEST(ProcessingErrorsTest, TypedErrorCarriesKindAndDetails) {
  OCRProcessingError error("engine crashed", {{"engine", "tesseract_psm6"}});
  EXPECT_EQ(error.kind(), ErrorKind::OCRProcessing);
  EXPECT_EQ(error.code(), "OCR_PROCESSING_ERROR");
  EXPECT_EQ(error.details().at("engine"), "tesseract_psm6");
  EXPECT_FALSE(error.isCritical());
  EXPECT_STREQ(error.what(), "engine crashed");
}

TEST(ProcessingErrorsTest, GenericErrorKeepsCustomCode) {
  ProcessingError error("bad state", {}, "CUSTOM_CODE");
  EXPECT_EQ(error.kind(), ErrorKind::Generic);
  EXPECT_EQ(error.code(), "CUSTOM_CODE");
}

TEST(ProcessingErrorsTest, MakeErrorRecord) {
  FileSecurityError error("File too large", {{"file_size", "123"}});
  ErrorRecord record = makeErrorRecord(error, "upload_validation");

  EXPECT_EQ(record.kind, ErrorKind::FileSecurity);
  EXPECT_EQ(record.code, "FILE_SECURITY_ERROR");
  EXPECT_EQ(record.type, "FileSecurityError");
  EXPECT_EQ(record.message, "File too large");
  EXPECT_EQ(record.step, "upload_validation");
  EXPECT_EQ(record.details.at("file_size"), "123");
  EXPECT_TRUE(record.critical);
  EXPECT_FALSE(record.timestamp.empty());
  EXPECT_NE(record.trace.find("File too large"), std::string::npos);
}

TEST(ProcessingErrorsTest, TraceIsBounded) {
  ProcessingError error(std::string(2000, 'x'));
  ErrorRecord record = makeErrorRecord(error, "ocr_processing");
  EXPECT_LE(record.trace.size(), kMaxTraceLength);
  EXPECT_EQ(record.message.size(), 2000u);
}

TEST(ProcessingErrorsTest, WrapTypedExceptionKeepsItsKind) {
  ErrorRecord record = wrapException(
      std::make_exception_ptr(LayoutAnalysisError("no page")),
      ErrorKind::Generic, "layout_analysis");
  EXPECT_EQ(record.kind, ErrorKind::LayoutAnalysis);
  EXPECT_EQ(record.code, "LAYOUT_ANALYSIS_ERROR");
  EXPECT_EQ(record.details.count("original_type"), 0u);
}

TEST(ProcessingErrorsTest, WrapForeignExceptionUsesFallbackKind) {
  ErrorRecord record =
      wrapException(std::make_exception_ptr(std::runtime_error("disk full")),
                    ErrorKind::TextExtraction, "text_extraction");
  EXPECT_EQ(record.kind, ErrorKind::TextExtraction);
  EXPECT_EQ(record.code, "TEXT_EXTRACTION_ERROR");
  EXPECT_EQ(record.message, "disk full");
  EXPECT_EQ(record.step, "text_extraction");
  EXPECT_EQ(record.details.count("original_type"), 1u);
}

TEST(ProcessingErrorsTest, WrapNonStandardException) {
  ErrorRecord record =
      wrapException(std::make_exception_ptr(42), ErrorKind::Generic);
  EXPECT_EQ(record.code, "PROCESSING_ERROR");
  EXPECT_EQ(record.message, "Unknown exception");
}

TEST(ProcessingErrorsTest, IsoTimestampFormat) {
  std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
  EXPECT_TRUE(std::regex_match(isoTimestamp(), iso));
}

TEST(ErrorHandlerTest, FailsJobAndNotifiesOnCriticalError) {
  auto notifier = std::make_shared<RecordingNotifier>();
  ErrorHandler handler(notifier);

  ProcessingJob job("doc-1");
  job.start();
  handler.handleProcessingError(
      makeErrorRecord(ProcessingTimeoutError("too slow"), "ocr_processing"), job);

  EXPECT_EQ(job.status(), JobStatus::Failed);
  ASSERT_TRUE(job.error().has_value());
  EXPECT_EQ(job.error()->code, "PROCESSING_TIMEOUT");
  ASSERT_EQ(notifier->errors.size(), 1u);
  EXPECT_EQ(notifier->jobs.front().status, JobStatus::Failed);
  EXPECT_EQ(notifier->jobs.front().documentId, "doc-1");
}

TEST(ErrorHandlerTest, NonCriticalErrorIsNotNotified) {
  auto notifier = std::make_shared<RecordingNotifier>();
  ErrorHandler handler(notifier);

  ProcessingJob job("doc-1");
  job.start();
  handler.handleProcessingError(
      makeErrorRecord(OCRProcessingError("no engines"), "ocr_processing"), job);

  EXPECT_EQ(job.status(), JobStatus::Failed);
  EXPECT_TRUE(notifier->errors.empty());
  EXPECT_EQ(handler.errorCount(), 1u);
}

TEST(ErrorHandlerTest, RecentErrorsAreBounded) {
  ErrorHandler handler(nullptr, 3);
  for (int i = 0; i < 5; ++i) {
    handler.logError(makeErrorRecord(ProcessingError("e" + std::to_string(i))));
  }

  EXPECT_EQ(handler.errorCount(), 3u);
  std::vector<ErrorRecord> recent = handler.recentErrors(2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].message, "e3");
  EXPECT_EQ(recent[1].message, "e4");

  handler.clear();
  EXPECT_EQ(handler.errorCount(), 0u);
  EXPECT_TRUE(handler.recentErrors().empty());
}

} // anonymous namespace

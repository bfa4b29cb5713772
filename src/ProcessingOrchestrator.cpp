#include "ProcessingOrchestrator.hpp"

#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace exam {

std::vector<ProcessingStep> standardStepPlan() {
  return {
      {"upload_validation", "Validating upload", 5, ErrorKind::FileSecurity, nullptr},
      {"text_detection", "Detecting text layer", 10, ErrorKind::TextExtraction, nullptr},
      {"ocr_processing", "Running OCR", 30, ErrorKind::OCRProcessing, nullptr},
      {"layout_analysis", "Analyzing layout", 15, ErrorKind::LayoutAnalysis, nullptr},
      {"text_extraction", "Extracting text", 20, ErrorKind::TextExtraction, nullptr},
      {"qa_detection", "Detecting questions", 15, ErrorKind::QuestionDetection, nullptr},
      {"answer_extraction", "Extracting answers", 3, ErrorKind::QuestionDetection, nullptr},
      {"confidence_scoring", "Scoring confidence", 2, ErrorKind::Generic, nullptr},
      {"finalization", "Saving results", 5, ErrorKind::Generic, nullptr},
  };
}

ProcessingOrchestrator::ProcessingOrchestrator(
    std::vector<ProcessingStep> steps, const OrchestratorConfig &config,
    std::shared_ptr<ProgressChannel> channel,
    std::shared_ptr<ErrorHandler> errorHandler)
    : m_steps(std::move(steps)), m_config(config),
      m_channel(std::move(channel)), m_errorHandler(std::move(errorHandler)) {
  int total = 0;
  for (const auto &step : m_steps) {
    if (step.weight < 0) {
      throw std::invalid_argument("Step " + step.name + " has a negative weight");
    }
    if (!step.run) {
      throw std::invalid_argument("Step " + step.name + " has no body");
    }
    total += step.weight;
  }
  if (total != 100) {
    throw std::invalid_argument("Step weights must sum to 100, got " +
                                std::to_string(total));
  }
}

bool ProcessingOrchestrator::run(ProcessingJob &job) const {
  ProcessingLogger logger(job.id(), job.documentId());
  return run(job, logger);
}

bool ProcessingOrchestrator::run(ProcessingJob &job,
                                 ProcessingLogger &logger) const {
  job.start();
  publish(job);

  auto jobStart = std::chrono::steady_clock::now();
  int cumulative = 0;

  for (std::size_t i = 0; i < m_steps.size(); ++i) {
    const ProcessingStep &step = m_steps[i];

    job.beginStep(step.name, step.display);
    publish(job);
    logger.logStepStart(step.name);

    auto stepStart = std::chrono::steady_clock::now();
    StepOutcome outcome = runWithTimeout(step);
    double seconds = std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - stepStart)
                         .count();

    if (!outcome.success()) {
      ErrorRecord error = *outcome.error;
      if (error.step.empty()) {
        error.step = step.name;
      }
      fail(job, error);
      return false;
    }

    if (step.commit) {
      step.commit();
    }
    job.recordStepDetails(step.name, outcome.details);
    logger.logStepComplete(step.name, seconds, outcome.details);

    cumulative += step.weight;
    if (i + 1 == m_steps.size()) {
      job.complete();
    } else {
      job.advanceProgress(cumulative);
    }
    publish(job);
  }

  std::ostringstream total;
  total << std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         jobStart)
               .count();
  logger.logPerformanceMetrics({{"total_seconds", total.str()},
                                {"steps", std::to_string(m_steps.size())}});
  return true;
}

StepOutcome ProcessingOrchestrator::runWithTimeout(const ProcessingStep &step) const {
  if (step.stage) {
    try {
      step.stage();
    } catch (...) {
      return StepOutcome::err(
          wrapException(std::current_exception(), step.errorKind, step.name));
    }
  }

  auto promise = std::make_shared<std::promise<StepOutcome>>();
  std::future<StepOutcome> future = promise->get_future();

  // Detached so a runaway step can be abandoned; it owns what it uses
  std::thread([promise, body = step.run]() {
    try {
      promise->set_value(body());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();

  if (future.wait_for(m_config.stepTimeout) == std::future_status::timeout) {
    auto limit = std::chrono::duration<double>(m_config.stepTimeout).count();
    std::ostringstream message;
    message << "Step " << step.name << " exceeded its time limit of " << limit
            << " seconds";
    ProcessingTimeoutError timeout(message.str(),
                                   {{"timeout_seconds", std::to_string(limit)}});
    return StepOutcome::err(makeErrorRecord(timeout, step.name));
  }

  try {
    return future.get();
  } catch (...) {
    return StepOutcome::err(
        wrapException(std::current_exception(), step.errorKind, step.name));
  }
}

void ProcessingOrchestrator::publish(const ProcessingJob &job) const {
  if (m_channel) {
    m_channel->publish(job.snapshot());
  }
}

void ProcessingOrchestrator::fail(ProcessingJob &job,
                                  const ErrorRecord &error) const {
  if (m_errorHandler) {
    m_errorHandler->handleProcessingError(error, job);
  } else {
    std::cerr << "ProcessingOrchestrator: job " << job.id() << " failed in "
              << error.step << ": " << error.message << std::endl;
    job.fail(error);
  }
  publish(job);
}

} // namespace exam

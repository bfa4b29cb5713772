#ifndef EXAM_PROCESSING_ORCHESTRATOR_HPP
#define EXAM_PROCESSING_ORCHESTRATOR_HPP

#include "ErrorHandler.hpp"
#include "ProcessingErrors.hpp"
#include "ProcessingJob.hpp"
#include "ProcessingLogger.hpp"
#include "ProgressChannel.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace exam {

/**
 * @brief Result of one pipeline step
 */
struct StepOutcome {
  StepDetails details;
  std::optional<ErrorRecord> error;

  bool success() const { return !error.has_value(); }

  static StepOutcome ok(StepDetails details = StepDetails()) {
    StepOutcome outcome;
    outcome.details = std::move(details);
    return outcome;
  }

  static StepOutcome err(ErrorRecord error) {
    StepOutcome outcome;
    outcome.error = std::move(error);
    return outcome;
  }
};

/**
 * @brief One named, weighted step of a processing run
 */
struct ProcessingStep {
  std::string name;    ///< Stable step name, e.g. "ocr_processing"
  std::string display; ///< Human-readable step name
  int weight = 0;      ///< Share of the total progress
  ErrorKind errorKind = ErrorKind::Generic; ///< Kind for untyped exceptions
  std::function<StepOutcome()> run;
  /// Optional, on the orchestrator's thread before run() starts
  std::function<void()> stage;
  /// Optional, on the orchestrator's thread after run() succeeded in time
  std::function<void()> commit;
};

struct OrchestratorConfig {
  std::chrono::milliseconds stepTimeout{std::chrono::seconds(300)};
};

/**
 * @brief The nine document processing steps without bodies, in order
 */
std::vector<ProcessingStep> standardStepPlan();

/**
 * @brief Runs steps in order and drives a job through its states
 *
 * After each step the job's progress is the cumulative weight of the
 * steps run so far; the last step completes the job. The first failure
 * (error outcome, exception or timeout) fails the job and skips the rest.
 * A step that exceeds the timeout is abandoned, not interrupted, and its
 * commit hook is never called.
 */
class ProcessingOrchestrator {
public:
  /**
   * @throws std::invalid_argument if the weights do not sum to 100, a
   *         weight is negative or a step has no body
   */
  ProcessingOrchestrator(std::vector<ProcessingStep> steps,
                         const OrchestratorConfig &config = OrchestratorConfig(),
                         std::shared_ptr<ProgressChannel> channel = nullptr,
                         std::shared_ptr<ErrorHandler> errorHandler = nullptr);

  /**
   * @brief Run all steps for @p job, which must be pending
   * @return True if the job completed
   */
  bool run(ProcessingJob &job, ProcessingLogger &logger) const;
  bool run(ProcessingJob &job) const;

  const std::vector<ProcessingStep> &steps() const { return m_steps; }

private:
  StepOutcome runWithTimeout(const ProcessingStep &step) const;
  void publish(const ProcessingJob &job) const;
  void fail(ProcessingJob &job, const ErrorRecord &error) const;

  std::vector<ProcessingStep> m_steps;
  OrchestratorConfig m_config;
  std::shared_ptr<ProgressChannel> m_channel;
  std::shared_ptr<ErrorHandler> m_errorHandler;
};

} // namespace exam

#endif // EXAM_PROCESSING_ORCHESTRATOR_HPP

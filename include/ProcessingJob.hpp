#ifndef EXAM_PROCESSING_JOB_HPP
#define EXAM_PROCESSING_JOB_HPP

#include "ProcessingErrors.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace exam {

enum class JobStatus { Pending, InProgress, Completed, Failed };

std::string jobStatusToString(JobStatus status);

using StepDetails = std::map<std::string, std::string>;

/**
 * @brief Complete, self-contained view of a job at one point in time
 *
 * Snapshots are what the progress channel delivers; a consumer can apply
 * them in any order and keep the highest progress it has seen.
 */
struct JobSnapshot {
  std::string jobId;
  std::string documentId;
  JobStatus status = JobStatus::Pending;
  std::string currentStep;
  std::string currentStepDisplay;
  int progressPercentage = 0;
  std::optional<ErrorRecord> error;
};

/**
 * @brief State of one processing run over one document
 *
 * Status moves pending -> in_progress -> completed | failed and never
 * leaves a terminal state. Progress never decreases while the job is
 * active and reaches 100 only through complete().
 */
class ProcessingJob {
public:
  explicit ProcessingJob(std::string documentId,
                         std::string jobId = std::string());

  const std::string &id() const { return m_id; }
  const std::string &documentId() const { return m_documentId; }
  JobStatus status() const { return m_status; }
  const std::string &currentStep() const { return m_currentStep; }
  const std::string &currentStepDisplay() const { return m_currentStepDisplay; }
  int progressPercentage() const { return m_progress; }
  const std::optional<ErrorRecord> &error() const { return m_error; }
  const std::map<std::string, StepDetails> &stepDetails() const {
    return m_stepDetails;
  }
  bool isTerminal() const {
    return m_status == JobStatus::Completed || m_status == JobStatus::Failed;
  }

  std::chrono::system_clock::time_point createdAt() const { return m_createdAt; }
  std::optional<std::chrono::system_clock::time_point> startedAt() const {
    return m_startedAt;
  }
  std::optional<std::chrono::system_clock::time_point> completedAt() const {
    return m_completedAt;
  }

  /**
   * @brief Move a pending job to in_progress
   * @throws std::logic_error if the job is not pending
   */
  void start();

  /**
   * @brief Record the step that is about to run
   */
  void beginStep(const std::string &step, const std::string &display);

  /**
   * @brief Raise progress to @p percentage
   * @throws std::logic_error if the job is not active, the value would
   *         decrease progress, or the value is 100 (reserved for complete())
   */
  void advanceProgress(int percentage);

  void recordStepDetails(const std::string &step, StepDetails details);

  /**
   * @brief Mark the job completed with progress 100
   */
  void complete();

  /**
   * @brief Mark the job failed; progress stays where it was
   */
  void fail(const ErrorRecord &error);

  JobSnapshot snapshot() const;

  static std::string generateId();

private:
  void requireActive(const char *operation) const;

  std::string m_id;
  std::string m_documentId;
  JobStatus m_status = JobStatus::Pending;
  std::string m_currentStep;
  std::string m_currentStepDisplay;
  int m_progress = 0;
  std::map<std::string, StepDetails> m_stepDetails;
  std::optional<ErrorRecord> m_error;
  std::chrono::system_clock::time_point m_createdAt;
  std::optional<std::chrono::system_clock::time_point> m_startedAt;
  std::optional<std::chrono::system_clock::time_point> m_completedAt;
};

} // namespace exam

#endif // EXAM_PROCESSING_JOB_HPP

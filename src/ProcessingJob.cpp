#include "ProcessingJob.hpp"

#include <atomic>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace exam {

std::string jobStatusToString(JobStatus status) {
  switch (status) {
  case JobStatus::Pending:
    return "pending";
  case JobStatus::InProgress:
    return "in_progress";
  case JobStatus::Completed:
    return "completed";
  case JobStatus::Failed:
    return "failed";
  }
  return "pending";
}

ProcessingJob::ProcessingJob(std::string documentId, std::string jobId)
    : m_id(jobId.empty() ? generateId() : std::move(jobId)),
      m_documentId(std::move(documentId)),
      m_createdAt(std::chrono::system_clock::now()) {
  m_currentStep = "upload_validation";
  m_currentStepDisplay = "Upload Validation";
}

std::string ProcessingJob::generateId() {
  static std::atomic<unsigned> counter{0};
  static thread_local std::mt19937 rng{std::random_device{}()};

  std::ostringstream id;
  id << "job-" << std::hex << std::setfill('0') << std::setw(8) << rng()
     << '-' << std::setw(4) << (counter++ & 0xffffu);
  return id.str();
}

void ProcessingJob::requireActive(const char *operation) const {
  if (m_status != JobStatus::InProgress) {
    throw std::logic_error(std::string(operation) + " requires an active job (" +
                           m_id + " is " + jobStatusToString(m_status) + ")");
  }
}

void ProcessingJob::start() {
  if (m_status != JobStatus::Pending) {
    throw std::logic_error("Job " + m_id + " cannot start from state " +
                           jobStatusToString(m_status));
  }
  m_status = JobStatus::InProgress;
  m_startedAt = std::chrono::system_clock::now();
}

void ProcessingJob::beginStep(const std::string &step,
                              const std::string &display) {
  requireActive("beginStep");
  m_currentStep = step;
  m_currentStepDisplay = display;
}

void ProcessingJob::advanceProgress(int percentage) {
  requireActive("advanceProgress");
  if (percentage < m_progress) {
    throw std::logic_error("Progress of job " + m_id + " cannot decrease from " +
                           std::to_string(m_progress) + " to " +
                           std::to_string(percentage));
  }
  if (percentage >= 100) {
    throw std::logic_error("Progress 100 is only reached by completing job " +
                           m_id);
  }
  m_progress = percentage;
}

void ProcessingJob::recordStepDetails(const std::string &step,
                                      StepDetails details) {
  m_stepDetails[step] = std::move(details);
}

void ProcessingJob::complete() {
  requireActive("complete");
  m_status = JobStatus::Completed;
  m_progress = 100;
  m_completedAt = std::chrono::system_clock::now();
}

void ProcessingJob::fail(const ErrorRecord &error) {
  if (isTerminal()) {
    throw std::logic_error("Job " + m_id + " is already " +
                           jobStatusToString(m_status));
  }
  m_status = JobStatus::Failed;
  m_error = error;
  m_completedAt = std::chrono::system_clock::now();
}

JobSnapshot ProcessingJob::snapshot() const {
  JobSnapshot snapshot;
  snapshot.jobId = m_id;
  snapshot.documentId = m_documentId;
  snapshot.status = m_status;
  snapshot.currentStep = m_currentStep;
  snapshot.currentStepDisplay = m_currentStepDisplay;
  snapshot.progressPercentage = m_progress;
  snapshot.error = m_error;
  return snapshot;
}

} // namespace exam

#include "ErrorHandler.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>

namespace exam {

void StderrNotifier::notifyCritical(const ErrorRecord &error,
                                    const JobSnapshot &job) {
  std::cerr << "CRITICAL: [" << error.code << "] job " << job.jobId
            << " (document " << job.documentId << ") failed at step '"
            << error.step << "': " << error.message << std::endl;
}

ErrorHandler::ErrorHandler(std::shared_ptr<Notifier> notifier,
                           std::size_t maxErrors)
    : m_notifier(std::move(notifier)), m_maxErrors(std::max<std::size_t>(
                                           maxErrors, 1)) {}

void ErrorHandler::logError(const ErrorRecord &error) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorLog.push_back(error);
    while (m_errorLog.size() > m_maxErrors) {
      m_errorLog.pop_front();
    }
  }

  std::cerr << "ERROR: [" << error.code << "] " << error.type;
  if (!error.step.empty()) {
    std::cerr << " in step '" << error.step << "'";
  }
  std::cerr << ": " << error.message << std::endl;
}

void ErrorHandler::handleProcessingError(const ErrorRecord &error,
                                         ProcessingJob &job) {
  logError(error);
  job.fail(error);

  if (error.critical && m_notifier) {
    try {
      m_notifier->notifyCritical(error, job.snapshot());
    } catch (const std::exception &e) {
      std::cerr << "ERROR: Failed to notify operators about job " << job.id()
                << ": " << e.what() << std::endl;
    }
  }
}

std::vector<ErrorRecord> ErrorHandler::recentErrors(std::size_t limit) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::size_t count = std::min(limit, m_errorLog.size());
  return std::vector<ErrorRecord>(
      m_errorLog.end() - static_cast<std::ptrdiff_t>(count), m_errorLog.end());
}

std::size_t ErrorHandler::errorCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_errorLog.size();
}

void ErrorHandler::clear() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_errorLog.clear();
}

} // namespace exam

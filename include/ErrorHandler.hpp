#ifndef EXAM_ERROR_HANDLER_HPP
#define EXAM_ERROR_HANDLER_HPP

#include "ProcessingErrors.hpp"
#include "ProcessingJob.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace exam {

/**
 * @brief Operator notification for critical failures
 */
class Notifier {
public:
  virtual ~Notifier() = default;

  virtual void notifyCritical(const ErrorRecord &error,
                              const JobSnapshot &job) = 0;
};

/**
 * @brief Notifier that writes an alert line to std::cerr
 */
class StderrNotifier : public Notifier {
public:
  void notifyCritical(const ErrorRecord &error,
                      const JobSnapshot &job) override;
};

/**
 * @brief Central error recorder
 *
 * Keeps a bounded in-memory log of recent errors, applies failures to
 * jobs and forwards critical errors to the notifier. Safe to share
 * between concurrently running jobs.
 */
class ErrorHandler {
public:
  explicit ErrorHandler(std::shared_ptr<Notifier> notifier = nullptr,
                        std::size_t maxErrors = 100);

  /**
   * @brief Append an error to the log and echo it to std::cerr
   */
  void logError(const ErrorRecord &error);

  /**
   * @brief Record a step failure on @p job and mark it failed
   *
   * The job's error details receive the record; critical errors are
   * passed to the notifier.
   */
  void handleProcessingError(const ErrorRecord &error, ProcessingJob &job);

  /**
   * @brief Most recent errors, newest last
   */
  std::vector<ErrorRecord> recentErrors(std::size_t limit = 10) const;

  std::size_t errorCount() const;
  void clear();

private:
  std::shared_ptr<Notifier> m_notifier;
  std::size_t m_maxErrors;
  mutable std::mutex m_mutex;
  std::deque<ErrorRecord> m_errorLog;
};

} // namespace exam

#endif // EXAM_ERROR_HANDLER_HPP

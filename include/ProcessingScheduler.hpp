#ifndef EXAM_PROCESSING_SCHEDULER_HPP
#define EXAM_PROCESSING_SCHEDULER_HPP

#include "ExtractionPipeline.hpp"
#include "ProcessingJob.hpp"

#include <condition_variable>
#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace exam {

/**
 * @brief Finished job together with the context of its run
 */
struct ScheduledRun {
  ProcessingJob job;
  std::shared_ptr<ProcessingContext> context;
};

/**
 * @brief Runs documents through a pipeline, one worker thread each
 *
 * At most maxConcurrentJobs documents are processed at once; further
 * submissions wait for a free slot. Threads of finished documents are
 * joined on the next submit. The destructor waits for every submitted
 * document.
 */
class ProcessingScheduler {
public:
  explicit ProcessingScheduler(std::shared_ptr<ExtractionPipeline> pipeline,
                               std::size_t maxConcurrentJobs = 5);
  ~ProcessingScheduler();

  ProcessingScheduler(const ProcessingScheduler &) = delete;
  ProcessingScheduler &operator=(const ProcessingScheduler &) = delete;

  /**
   * @brief Queue a pending job for processing
   * @param job Pending job; its id identifies the run's progress snapshots
   * @param paths One PDF, or one PNG per page
   */
  std::future<ScheduledRun> submit(ProcessingJob job,
                                   std::vector<std::string> paths);

  /**
   * @brief Block until every submitted document has finished
   */
  void waitAll();

  std::size_t activeJobs() const;
  std::size_t maxConcurrentJobs() const { return m_maxConcurrent; }

  /**
   * @brief Worker threads not yet joined, running or finished
   */
  std::size_t workerCount() const;

private:
  void acquireSlot();
  void releaseSlot();
  void markFinished(std::size_t workerId);

  std::shared_ptr<ExtractionPipeline> m_pipeline;
  std::size_t m_maxConcurrent;

  mutable std::mutex m_mutex;
  std::condition_variable m_slotFree;
  std::size_t m_active = 0;

  mutable std::mutex m_workersMutex;
  std::map<std::size_t, std::thread> m_workers;
  std::vector<std::size_t> m_finishedWorkers;
  std::size_t m_nextWorkerId = 0;
};

} // namespace exam

#endif // EXAM_PROCESSING_SCHEDULER_HPP

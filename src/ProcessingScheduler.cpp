#include "ProcessingScheduler.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace exam {

ProcessingScheduler::ProcessingScheduler(
    std::shared_ptr<ExtractionPipeline> pipeline, std::size_t maxConcurrentJobs)
    : m_pipeline(std::move(pipeline)),
      m_maxConcurrent(std::max<std::size_t>(maxConcurrentJobs, 1)) {
  if (!m_pipeline) {
    throw std::invalid_argument("ProcessingScheduler requires a pipeline");
  }
}

ProcessingScheduler::~ProcessingScheduler() { waitAll(); }

std::future<ScheduledRun>
ProcessingScheduler::submit(ProcessingJob job, std::vector<std::string> paths) {
  auto promise = std::make_shared<std::promise<ScheduledRun>>();
  std::future<ScheduledRun> future = promise->get_future();

  std::vector<std::thread> finished;
  {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    for (std::size_t id : m_finishedWorkers) {
      auto it = m_workers.find(id);
      if (it != m_workers.end()) {
        finished.push_back(std::move(it->second));
        m_workers.erase(it);
      }
    }
    m_finishedWorkers.clear();

    // The worker reports back under the same lock, so it is registered first
    std::size_t id = m_nextWorkerId++;
    m_workers.emplace(
        id, std::thread([this, id, promise, job = std::move(job),
                         paths = std::move(paths)]() mutable {
          acquireSlot();
          try {
            std::shared_ptr<ProcessingContext> context =
                m_pipeline->process(job, paths);
            releaseSlot();
            markFinished(id);
            promise->set_value(ScheduledRun{std::move(job), std::move(context)});
          } catch (...) {
            releaseSlot();
            markFinished(id);
            std::cerr << "ProcessingScheduler: job " << job.id()
                      << " ended with an exception" << std::endl;
            promise->set_exception(std::current_exception());
          }
        }));
  }

  for (auto &worker : finished) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  return future;
}

void ProcessingScheduler::waitAll() {
  std::map<std::size_t, std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    workers.swap(m_workers);
    m_finishedWorkers.clear();
  }
  for (auto &entry : workers) {
    if (entry.second.joinable()) {
      entry.second.join();
    }
  }
}

std::size_t ProcessingScheduler::workerCount() const {
  std::lock_guard<std::mutex> lock(m_workersMutex);
  return m_workers.size();
}

void ProcessingScheduler::markFinished(std::size_t workerId) {
  std::lock_guard<std::mutex> lock(m_workersMutex);
  m_finishedWorkers.push_back(workerId);
}

std::size_t ProcessingScheduler::activeJobs() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_active;
}

void ProcessingScheduler::acquireSlot() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_slotFree.wait(lock, [this] { return m_active < m_maxConcurrent; });
  ++m_active;
}

void ProcessingScheduler::releaseSlot() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    --m_active;
  }
  m_slotFree.notify_one();
}

} // namespace exam

#ifndef EXAM_PROGRESS_CHANNEL_HPP
#define EXAM_PROGRESS_CHANNEL_HPP

#include "ProcessingJob.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace exam {

/**
 * @brief Thread-safe publish/subscribe channel for job snapshots
 *
 * Subscribers are called on the publishing thread, outside the channel
 * lock. A new subscriber immediately receives the latest snapshot of the
 * job it subscribes to, if one was published. The final snapshots of only
 * the most recently finished jobs are retained; older ones are evicted.
 */
class ProgressChannel {
public:
  using Subscriber = std::function<void(const JobSnapshot &)>;
  using SubscriptionId = std::size_t;

  /**
   * @param finishedRetention Completed or failed jobs whose final snapshot
   *        is kept for latest() and late subscribers
   */
  explicit ProgressChannel(std::size_t finishedRetention = 256);

  /**
   * @brief Register a subscriber
   * @param subscriber Callback receiving snapshots
   * @param jobId Only deliver snapshots of this job; empty for all jobs
   */
  SubscriptionId subscribe(Subscriber subscriber,
                           const std::string &jobId = std::string());

  void unsubscribe(SubscriptionId id);

  void publish(const JobSnapshot &snapshot);

  /**
   * @brief Most recent snapshot published for a job
   */
  std::optional<JobSnapshot> latest(const std::string &jobId) const;

  std::size_t subscriberCount() const;

  /**
   * @brief Jobs with a retained snapshot, active or finished
   */
  std::size_t trackedJobs() const;

private:
  struct Subscription {
    std::string jobId;
    Subscriber callback;
  };

  mutable std::mutex m_mutex;
  std::map<SubscriptionId, Subscription> m_subscribers;
  std::map<std::string, JobSnapshot> m_latest;
  std::deque<std::string> m_finished; ///< Finished job ids, oldest first
  std::size_t m_finishedRetention;
  SubscriptionId m_nextId = 1;
};

} // namespace exam

#endif // EXAM_PROGRESS_CHANNEL_HPP

#include "ProgressChannel.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace exam {

namespace {

bool isFinished(const JobSnapshot &snapshot) {
  return snapshot.status == JobStatus::Completed ||
         snapshot.status == JobStatus::Failed;
}

void deliver(const ProgressChannel::Subscriber &callback,
             const JobSnapshot &snapshot) {
  try {
    callback(snapshot);
  } catch (const std::exception &e) {
    std::cerr << "ProgressChannel: subscriber failed for job "
              << snapshot.jobId << ": " << e.what() << std::endl;
  }
}

} // anonymous namespace

ProgressChannel::ProgressChannel(std::size_t finishedRetention)
    : m_finishedRetention(finishedRetention) {}

ProgressChannel::SubscriptionId
ProgressChannel::subscribe(Subscriber subscriber, const std::string &jobId) {
  std::optional<JobSnapshot> current;
  SubscriptionId id;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    id = m_nextId++;
    m_subscribers[id] = Subscription{jobId, subscriber};
    if (!jobId.empty()) {
      auto it = m_latest.find(jobId);
      if (it != m_latest.end()) {
        current = it->second;
      }
    }
  }

  if (current) {
    deliver(subscriber, *current);
  }
  return id;
}

void ProgressChannel::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_subscribers.erase(id);
}

void ProgressChannel::publish(const JobSnapshot &snapshot) {
  std::vector<Subscriber> targets;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_latest[snapshot.jobId] = snapshot;
    if (isFinished(snapshot) &&
        std::find(m_finished.begin(), m_finished.end(), snapshot.jobId) ==
            m_finished.end()) {
      m_finished.push_back(snapshot.jobId);
      while (m_finished.size() > m_finishedRetention) {
        m_latest.erase(m_finished.front());
        m_finished.pop_front();
      }
    }
    for (const auto &entry : m_subscribers) {
      if (entry.second.jobId.empty() || entry.second.jobId == snapshot.jobId) {
        targets.push_back(entry.second.callback);
      }
    }
  }

  for (const auto &callback : targets) {
    deliver(callback, snapshot);
  }
}

std::optional<JobSnapshot>
ProgressChannel::latest(const std::string &jobId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_latest.find(jobId);
  if (it == m_latest.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t ProgressChannel::subscriberCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_subscribers.size();
}

std::size_t ProgressChannel::trackedJobs() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_latest.size();
}

} // namespace exam

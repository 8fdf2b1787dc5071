/**
 * @file job_queue.cpp
 * @brief Job queue implementation
 */

#include "vconv/job_queue.hpp"

#include <utility>

namespace vconv {

bool JobQueue::push(Job job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_.load())
      return false;
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
  return true;
}

bool JobQueue::pop(Job &job) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !jobs_.empty() || done_.load(); });

  if (jobs_.empty()) {
    return false;
  }

  job = std::move(jobs_.front());
  jobs_.pop_front();
  return true;
}

void JobQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

std::vector<Job> JobQueue::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> out;
  out.reserve(jobs_.size());
  for (auto &job : jobs_)
    out.push_back(std::move(job));
  jobs_.clear();
  return out;
}

} // namespace vconv

/**
 * @file job_queue.hpp
 * @brief Thread-safe Job queue between the scan coordinator and workers
 *
 * @details Producer-consumer hand-off:
 *
 *          - The coordinator pushes claimed Jobs after each scan
 *
 *          - Worker threads pop() in a loop, one Job at a time
 *
 *          - finish() wakes every worker and makes pop() return false once
 *            the queue is drained; drain() drops Jobs that never started
 */

#ifndef VCONV_JOB_QUEUE_HPP
#define VCONV_JOB_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

#include "types.hpp"

namespace vconv {

class JobQueue {
public:
  /**
   * @brief Push a job to the queue.
   * @return false if the queue was already finished (job not queued)
   */
  bool push(Job job);

  /**
   * @brief Pop a job from the queue (blocking).
   * @param job Output: the job to execute
   * @return true if job was retrieved, false if queue is finished
   */
  bool pop(Job &job);

  /**
   * @brief Signal that no more jobs will be pushed.
   */
  void finish();

  /// Remove and return every queued (not yet started) job
  std::vector<Job> drain();

  bool is_done() const { return done_.load() && empty(); }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  std::atomic<bool> done_{false};
};

} // namespace vconv

#endif // VCONV_JOB_QUEUE_HPP

/**
 * @file scheduler.hpp
 * @brief Periodic scan cycles and the bounded worker pool
 *
 * @details Each scan cycle:
 *
 *          - Takes a ProcessedSet snapshot
 *
 *          - Walks the roots and drops candidates that are already
 *            processed, already claimed, still being written (min file
 *            age), over the transfer limit, or whose converted sibling
 *            already exists
 *
 *          - Claims and queues the rest, up to the free worker capacity
 *
 *          Cycles are serialized: a new cycle's scan/filter/dispatch phase
 *          never starts while another is running. Jobs dispatched by an
 *          earlier cycle may still be executing; the ClaimTable keeps them
 *          exclusive.
 *
 * @attention SHUTDOWN:
 *
 *   - request_stop() stops dispatch at once and drops queued Jobs
 *
 *   - Running Jobs that finish converting within the grace period are
 *     committed; the rest have their encoder killed and are abandoned
 *     without recording their fingerprint
 */

#ifndef VCONV_SCHEDULER_HPP
#define VCONV_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "claim_table.hpp"
#include "committer.hpp"
#include "config.hpp"
#include "job_queue.hpp"
#include "processed_store.hpp"
#include "scanner.hpp"
#include "transfer_backend.hpp"
#include "types.hpp"

namespace vconv {

/**
 * @struct CycleReport
 * @brief What one scan cycle saw and did.
 */
struct CycleReport {
  size_t discovered = 0;
  size_t already_processed = 0;
  size_t output_exists = 0;
  size_t claimed = 0;   //< Already in flight from an earlier cycle
  size_t too_young = 0; //< Modified within min_file_age
  size_t too_large = 0; //< Over the backend's transfer limit
  size_t dispatched = 0;
  size_t deferred = 0; //< Eligible but no free worker this cycle
  size_t pending = 0;  //< Eligible (dry-run: would be converted)
  std::map<std::string, size_t> pending_by_root;
  std::vector<std::string> pending_paths;
  ScanStats scan;
  bool skipped = false; //< Not run because the scheduler is stopping
};

/**
 * @struct SchedulerTotals
 * @brief Lifetime counters, printed at shutdown.
 */
struct SchedulerTotals {
  size_t cycles = 0;
  size_t dispatched = 0;
  size_t committed = 0;
  size_t failed = 0;
  size_t abandoned = 0;
};

class Scheduler {
public:
  Scheduler(const Settings &settings, TransferBackend &backend,
            ProcessedStore &store);
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  /**
   * @brief Create the work directory and launch max_jobs worker threads.
   * @note Not needed (and not done) in dry-run mode.
   * @return false with err set if the work directory is unusable
   */
  bool start(std::string &err);

  /**
   * @brief Run one scan cycle synchronously.
   * @note Returns once Jobs are queued, not once they finish.
   */
  CycleReport run_cycle();

  /**
   * @brief Daemon loop: a cycle every scan interval until stop_flag is set.
   * @note Polls stop_flag once a second and between candidates; the first
   *       time it is seen set, request_stop() runs.
   */
  void run(const std::atomic<bool> &stop_flag);

  /**
   * @brief Watch an external flag (set by a signal handler) during cycles.
   * @note A set flag triggers request_stop() before the next candidate is
   *       dispatched. The flag must outlive the Scheduler.
   */
  void watch_stop_flag(const std::atomic<bool> &stop_flag);

  /// Block until no Job is queued or running
  void wait_idle();

  /// wait_idle() bounded by a timeout; true if idle
  bool wait_idle_for(std::chrono::milliseconds timeout);

  /// Stop dispatching, drop queued Jobs and start the grace period
  void request_stop();

  /// request_stop(), then join every worker
  void stop();

  bool stopping() const { return stopping_.load(); }

  const ClaimTable &claims() const { return claims_; }
  SchedulerTotals totals() const;

  /// Consecutive failures recorded for a fingerprint
  int failure_count(const std::string &fingerprint) const;

  /// Print the lifetime summary table
  void print_summary() const;

private:
  using Clock = std::chrono::steady_clock;

  const Settings &settings_;
  TransferBackend &backend_;
  ProcessedStore &store_;
  Scanner scanner_;
  Committer committer_;
  ClaimTable claims_;
  JobQueue queue_;

  std::vector<std::thread> workers_;
  std::mutex cycle_mutex_; //< Serializes scan cycles

  mutable std::mutex state_mutex_; //< Guards in_flight_, totals_, failures_
  std::condition_variable idle_cv_;
  size_t in_flight_ = 0; //< Queued + running Jobs
  SchedulerTotals totals_;
  std::unordered_map<std::string, int> failures_;

  std::atomic<bool> stopping_{false};
  std::atomic<const std::atomic<bool> *> stop_flag_{nullptr};
  std::atomic<long long> abandon_at_ns_{0}; //< Clock epoch ns, valid if stopping_

  /**
   * @brief Worker function for each pool thread.
   * @param worker_id The worker's ID (0-indexed), used in log prefixes
   */
  void worker(int worker_id);

  /// Run one Job end to end; never throws
  JobResult execute(Job &job, int worker_id);

  /// Set the terminal state, update counters, failure tracker and ClaimTable
  void finish_job(Job &job, const JobResult &result, int worker_id);

  /// true if stopping; a newly set external flag starts request_stop() here
  bool stop_signalled();

  /// true once the shutdown grace period has run out
  bool abandon_due() const;

  std::string work_file(const Job &job, const std::string &tag,
                        const std::string &extension) const;
  void log_report(const CycleReport &report, double elapsed_sec) const;
};

} // namespace vconv

#endif // VCONV_SCHEDULER_HPP

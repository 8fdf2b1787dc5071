/**
 * @file scheduler.cpp
 * @brief Scan cycles, dispatch and the worker pool
 *
 * @details Implements the Scheduler:
 *
 *          - Serialized scan cycles against a ProcessedSet snapshot
 *
 *          - Fixed pool of worker threads fed through a JobQueue
 *
 *          - Per-fingerprint failure tracking
 *
 *          - Cooperative shutdown with a bounded grace period
 */

#include "vconv/scheduler.hpp"

#include <cerrno>
#include <cstdio>
#include <ctime>
#include <exception>
#include <filesystem>

#include <unistd.h>

#include <fmt/color.h>
#include <fmt/core.h>

#include "vconv/converter.hpp"
#include "vconv/fingerprint.hpp"
#include "vconv/logging.hpp"
#include "vconv/system.hpp"

namespace vconv {

namespace fs = std::filesystem;

namespace {

ScanFilter make_filter(const Settings &settings) {
  ScanFilter filter;
  filter.roots = settings.roots;
  filter.include_extensions = settings.include_extensions;
  filter.exclude_patterns = settings.exclude_patterns;
  return filter;
}

/// Remove a local work file; a missing file is not an error
void remove_work_file(const std::string &path) {
  if (path.empty())
    return;
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    LOG_WARN("Could not remove work file {}: {}", path, errno_string(errno));
  }
}

} // anonymous namespace

Scheduler::Scheduler(const Settings &settings, TransferBackend &backend,
                     ProcessedStore &store)
    : settings_(settings), backend_(backend), store_(store),
      scanner_(backend, make_filter(settings)),
      committer_(backend, store, settings) {}

Scheduler::~Scheduler() { stop(); }

bool Scheduler::start(std::string &err) {
  if (settings_.dry_run)
    return true;

  std::error_code ec;
  fs::create_directories(settings_.work_dir, ec);
  if (ec) {
    err = fmt::format("cannot create work directory {}: {}", settings_.work_dir,
                      ec.message());
    return false;
  }
  if (::access(settings_.work_dir.c_str(), W_OK) != 0) {
    err = fmt::format("work directory {} is not writable: {}",
                      settings_.work_dir, errno_string(errno));
    return false;
  }

  for (int i = 0; i < settings_.max_jobs; ++i) {
    workers_.emplace_back(&Scheduler::worker, this, i);
  }
  LOG_INFO("Started {} worker(s), work directory {}", settings_.max_jobs,
           settings_.work_dir);
  return true;
}

// **---- Scan cycle ----**

CycleReport Scheduler::run_cycle() {
  std::lock_guard<std::mutex> cycle_lock(cycle_mutex_);
  CycleReport report;
  if (stop_signalled()) {
    report.skipped = true;
    return report;
  }

  auto cycle_start = std::chrono::steady_clock::now();
  const ProcessedStore::Snapshot processed = store_.snapshot();
  const std::int64_t now = static_cast<std::int64_t>(std::time(nullptr));
  const std::uint64_t max_bytes = backend_.max_transfer_bytes();

  size_t capacity = 0;
  if (!settings_.dry_run) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const size_t limit = static_cast<size_t>(settings_.max_jobs);
    capacity = in_flight_ < limit ? limit - in_flight_ : 0;
  }

  report.scan = scanner_.scan([&](const Candidate &c) {
    /// Dispatch ends the moment a stop is signalled, even mid-walk
    if (stop_signalled())
      return false;
    ++report.discovered;
    LOG_EVENT(LogEvent::Discovered, "{} ({})", c.path, format_bytes(c.size));

    std::string fp;
    try {
      fp = fingerprint_of(c.path);
    } catch (const std::exception &e) {
      LOG_ERROR("Cannot fingerprint {}: {}", c.path, e.what());
      return true;
    }

    if (processed->count(fp)) {
      ++report.already_processed;
      LOG_EVENT(LogEvent::Skipped, "{} (already processed)", c.path);
      return true;
    }
    if (claims_.contains(fp)) {
      ++report.claimed;
      LOG_EVENT(LogEvent::Skipped, "{} (in flight)", c.path);
      return true;
    }
    if (now - c.mtime < settings_.min_file_age_sec) {
      ++report.too_young;
      LOG_EVENT(LogEvent::Skipped, "{} (modified {}s ago, still settling)",
                c.path, now - c.mtime);
      return true;
    }
    if (max_bytes > 0 && c.size > max_bytes) {
      ++report.too_large;
      LOG_WARN("Skipping {}: {} exceeds the transfer limit of {}", c.path,
               format_bytes(c.size), format_bytes(max_bytes));
      return true;
    }

    const std::string destination =
        output_path_for(c.path, settings_.output_extension);
    if (destination != c.path) {
      FileEntry existing;
      std::string err;
      if (backend_.stat(destination, existing, err)) {
        ++report.output_exists;
        LOG_EVENT(LogEvent::Skipped, "{} (output {} exists)", c.path,
                  destination);
        return true;
      }
      if (!err.empty()) {
        LOG_WARN("Cannot check for {}: {}; retrying next cycle", destination,
                 err);
        return true;
      }
    }

    ++report.pending;
    ++report.pending_by_root[c.root];

    if (settings_.dry_run) {
      report.pending_paths.push_back(c.path);
      LOG_INFO("[dry-run] Would convert {} -> {}", c.path, destination);
      return true;
    }
    if (report.dispatched >= capacity) {
      ++report.deferred;
      return true;
    }
    if (!claims_.try_claim(fp)) {
      ++report.claimed;
      return true;
    }

    Job job;
    job.candidate = c;
    job.fingerprint = fp;
    job.destination = destination;
    job.state = JobState::Claimed;
    LOG_EVENT(LogEvent::Claimed, "{}", c.path);

    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      ++in_flight_;
      ++totals_.dispatched;
    }
    if (!queue_.push(std::move(job))) {
      /// Queue closed by a concurrent stop
      claims_.release(fp);
      std::lock_guard<std::mutex> lock(state_mutex_);
      --in_flight_;
      --totals_.dispatched;
      idle_cv_.notify_all();
      ++report.deferred;
      return true;
    }
    ++report.dispatched;
    return true;
  });

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++totals_.cycles;
  }

  double elapsed = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - cycle_start)
                       .count();
  log_report(report, elapsed);
  return report;
}

void Scheduler::log_report(const CycleReport &report,
                           double elapsed_sec) const {
  LOG_INFO("Cycle: {} discovered, {} processed, {} output exists, {} in "
           "flight, {} settling, {} too large, {} pending, {} dispatched, {} "
           "deferred ({:.1f}s)",
           report.discovered, report.already_processed, report.output_exists,
           report.claimed, report.too_young, report.too_large, report.pending,
           report.dispatched, report.deferred, elapsed_sec);
  if (report.scan.roots_failed > 0) {
    LOG_WARN("{} of {} root(s) could not be scanned", report.scan.roots_failed,
             report.scan.roots_failed + report.scan.roots_scanned);
  }
}

void Scheduler::run(const std::atomic<bool> &stop_flag) {
  LOG_PHASE("==================== VCONV DAEMON ====================");
  LOG_INFO("Backend: {}", backend_.describe());
  for (const auto &root : settings_.roots)
    LOG_INFO("Root: {}", root);
  LOG_INFO("Max jobs: {}, scan interval: {}s{}", settings_.max_jobs,
           settings_.scan_interval_sec, settings_.dry_run ? " (dry-run)" : "");
  LOG_PHASE("======================================================");

  watch_stop_flag(stop_flag);
  while (!stop_signalled()) {
    try {
      run_cycle();
    } catch (const std::exception &e) {
      LOG_ERROR("Scan cycle failed: {}", e.what());
    }

    /// Poll interval, woken early by the stop flag
    for (int waited = 0;
         waited < settings_.scan_interval_sec && !stop_signalled(); ++waited) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
  }
  LOG_INFO("Stop requested, no further scans");
}

void Scheduler::watch_stop_flag(const std::atomic<bool> &stop_flag) {
  stop_flag_.store(&stop_flag);
}

bool Scheduler::stop_signalled() {
  if (stopping_.load())
    return true;
  const std::atomic<bool> *flag = stop_flag_.load();
  if (flag == nullptr || !flag->load())
    return false;
  request_stop();
  return true;
}

void Scheduler::wait_idle() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  idle_cv_.wait(lock, [this] { return in_flight_ == 0; });
}

bool Scheduler::wait_idle_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

// **---- Shutdown ----**

void Scheduler::request_stop() {
  if (stopping_.exchange(true))
    return;

  const auto abandon_at =
      Clock::now() + std::chrono::seconds(settings_.shutdown_grace_sec);
  abandon_at_ns_.store(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          abandon_at.time_since_epoch())
          .count());

  queue_.finish();
  std::vector<Job> dropped = queue_.drain();
  for (auto &job : dropped) {
    JobResult result;
    result.outcome = JobOutcome::Abandoned;
    result.message = "never started";
    finish_job(job, result, -1);
  }
  if (!workers_.empty()) {
    LOG_INFO("Shutdown: dropped {} queued job(s), {}s grace for running jobs",
             dropped.size(), settings_.shutdown_grace_sec);
  }
}

void Scheduler::stop() {
  request_stop();
  for (auto &w : workers_) {
    if (w.joinable())
      w.join();
  }
  workers_.clear();
}

bool Scheduler::abandon_due() const {
  if (!stopping_.load())
    return false;
  const long long now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                               Clock::now().time_since_epoch())
                               .count();
  return now_ns >= abandon_at_ns_.load();
}

// **---- Workers ----**

void Scheduler::worker(int worker_id) {
  Job job;
  while (queue_.pop(job)) {
    JobResult result = execute(job, worker_id);
    finish_job(job, result, worker_id);
  }
  LOG_DEBUG("[Worker {}] Finished (queue closed)", worker_id);
}

std::string Scheduler::work_file(const Job &job, const std::string &tag,
                                 const std::string &extension) const {
  return fmt::format("{}/{}_{}.{}", settings_.work_dir, job.fingerprint, tag,
                     extension);
}

JobResult Scheduler::execute(Job &job, int worker_id) {
  JobResult result;
  result.outcome = JobOutcome::Failed;
  const std::string &source = job.candidate.path;
  const std::string log_path = work_file(job, "encoder", "log");

  try {
    if (abandon_due()) {
      result.outcome = JobOutcome::Abandoned;
      result.message = "shutdown grace expired before start";
      return result;
    }

    // **---- Transfer in ----**

    std::string err;
    if (backend_.is_remote()) {
      job.staged_input =
          work_file(job, "input", job.candidate.extension.empty()
                                      ? std::string("bin")
                                      : job.candidate.extension);
      LOG_INFO("[Worker {}] Downloading {}", worker_id, source);
      TIMER_START(download);
      const bool fetched = backend_.fetch(
          source, job.staged_input, [this] { return abandon_due(); }, err);
      TIMER_END(download);
      if (!fetched) {
        remove_work_file(job.staged_input);
        if (abandon_due()) {
          result.outcome = JobOutcome::Abandoned;
          result.message = "download cancelled for shutdown";
          return result;
        }
        result.error = ErrorKind::Transfer;
        result.message = "download failed: " + err;
        return result;
      }
    } else {
      job.staged_input = source;
    }

    // **---- Convert ----**

    job.staged_output = work_file(job, "output", settings_.output_extension);
    remove_work_file(job.staged_output);
    job.state = JobState::Converting;
    LOG_EVENT(LogEvent::Converting, "[Worker {}] {}", worker_id, source);

    MediaInfo info;
    const EncodeStatus status =
        convert_file(settings_.encoder, job.staged_input, job.staged_output,
                     log_path, [this] { return abandon_due(); }, info, err);

    if (status == EncodeStatus::Cancelled || abandon_due()) {
      result.outcome = JobOutcome::Abandoned;
      result.message = status == EncodeStatus::Cancelled
                           ? err
                           : "shutdown grace expired before commit";
    } else if (status != EncodeStatus::Ok) {
      result.error = ErrorKind::Conversion;
      result.message = fmt::format("{}: {}", to_string(status), err);
    } else {
      // **---- Commit ----**
      job.state = JobState::Committing;
      result = committer_.commit(job, [this] { return abandon_due(); });
    }
  } catch (const std::exception &e) {
    result.outcome = JobOutcome::Failed;
    if (result.error == ErrorKind::None)
      result.error = ErrorKind::Conversion;
    result.message = std::string("unexpected error: ") + e.what();
  }

  /// Staged files never outlive the Job
  if (backend_.is_remote())
    remove_work_file(job.staged_input);
  remove_work_file(job.staged_output);
  if (result.outcome == JobOutcome::Committed)
    remove_work_file(log_path);
  return result;
}

void Scheduler::finish_job(Job &job, const JobResult &result,
                           int worker_id) {
  const std::string &path = job.candidate.path;
  int failures = 0;
  job.state = result.outcome == JobOutcome::Committed ? JobState::Committed
                                                      : JobState::Failed;
  LOG_DEBUG("[Worker {}] {} is {} ({})", worker_id, path, to_string(job.state),
            to_string(result.outcome));

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    switch (result.outcome) {
    case JobOutcome::Committed:
      ++totals_.committed;
      failures_.erase(job.fingerprint);
      break;
    case JobOutcome::Failed:
      ++totals_.failed;
      failures = ++failures_[job.fingerprint];
      break;
    case JobOutcome::Abandoned:
      ++totals_.abandoned;
      break;
    }
  }

  switch (result.outcome) {
  case JobOutcome::Committed:
    LOG_EVENT(LogEvent::Committed, "[Worker {}] {} -> {}", worker_id, path,
              job.destination);
    break;
  case JobOutcome::Failed:
    if (failures >= settings_.failure_threshold) {
      LOG_ERROR("[Worker {}] persistent {} on {} ({} consecutive attempts): {}",
                worker_id, to_string(result.error), path, failures,
                result.message);
    } else {
      LOG_EVENT(LogEvent::Failed, "[Worker {}] {} on {} (attempt {}): {}",
                worker_id, to_string(result.error), path, failures,
                result.message);
    }
    break;
  case JobOutcome::Abandoned:
    LOG_EVENT(LogEvent::Abandoned, "{} ({})", path, result.message);
    break;
  }

  /// Release the claim last: the fingerprint is durable (or not) by now
  claims_.release(job.fingerprint);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    --in_flight_;
  }
  idle_cv_.notify_all();
}

// **---- Reporting ----**

SchedulerTotals Scheduler::totals() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return totals_;
}

int Scheduler::failure_count(const std::string &fingerprint) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto it = failures_.find(fingerprint);
  return it == failures_.end() ? 0 : it->second;
}

void Scheduler::print_summary() const {
  const SchedulerTotals t = totals();
  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=================== VCONV SUMMARY ====================\n");
  fmt::print("{:<25} {:>25}\n", "Scan cycles:", t.cycles);
  fmt::print("{:<25} {:>25}\n", "Dispatched:", t.dispatched);
  fmt::print("{:<25} {:>25}\n", "Committed:", t.committed);
  fmt::print("{:<25} {:>25}\n", "Failed:", t.failed);
  fmt::print("{:<25} {:>25}\n", "Abandoned:", t.abandoned);
  fmt::print("{:<25} {:>25}\n", "Processed (total):", store_.size());
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");
  std::fflush(stdout);
}

} // namespace vconv

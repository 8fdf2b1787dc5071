/**
 * @file commands.cpp
 * @brief vconvd subcommand implementations
 */

#include "vconv/commands.hpp"

#include <chrono>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "vconv/converter.hpp"
#include "vconv/local_backend.hpp"
#include "vconv/logging.hpp"
#include "vconv/processed_store.hpp"
#include "vconv/scheduler.hpp"
#include "vconv/sftp_backend.hpp"

namespace vconv {

namespace {

std::string join(const std::vector<std::string> &items, const char *sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0)
      out += sep;
    out += items[i];
  }
  return out;
}

} // anonymous namespace

std::unique_ptr<TransferBackend> make_backend(const Settings &settings) {
  if (!settings.remote.enabled)
    return std::make_unique<LocalBackend>();

  auto sftp = std::make_unique<SftpBackend>(settings.remote);
  std::string err;
  if (!sftp->connect(err)) {
    LOG_ERROR("Initial connection to {} failed: {}", sftp->describe(), err);
  }
  return sftp;
}

int cmd_run(const Settings &settings, const std::atomic<bool> &stop_flag) {
  ProcessedStore store(settings.state_dir);
  store.load(!settings.dry_run);

  auto backend = make_backend(settings);
  Scheduler scheduler(settings, *backend, store);

  std::string err;
  if (!scheduler.start(err)) {
    LOG_ERROR("{}", err);
    return 1;
  }

  scheduler.run(stop_flag);
  scheduler.stop();
  scheduler.print_summary();
  TimingCollector::print_summary();
  return 0;
}

int cmd_once(const Settings &settings, const std::atomic<bool> &stop_flag) {
  ProcessedStore store(settings.state_dir);
  store.load(!settings.dry_run);

  auto backend = make_backend(settings);
  Scheduler scheduler(settings, *backend, store);

  std::string err;
  if (!scheduler.start(err)) {
    LOG_ERROR("{}", err);
    return 1;
  }

  scheduler.watch_stop_flag(stop_flag);
  scheduler.run_cycle();
  while (!scheduler.wait_idle_for(std::chrono::milliseconds(500))) {
    if (stop_flag.load()) {
      LOG_INFO("Stop requested while jobs are running");
      break;
    }
  }
  scheduler.stop();
  scheduler.print_summary();
  TimingCollector::print_summary();

  const SchedulerTotals totals = scheduler.totals();
  return (totals.failed > 0 || totals.abandoned > 0) ? 1 : 0;
}

int cmd_pending(const Settings &settings) {
  Settings dry = settings;
  dry.dry_run = true;

  ProcessedStore store(dry.state_dir);
  store.load(false);

  auto backend = make_backend(dry);
  Scheduler scheduler(dry, *backend, store);
  const CycleReport report = scheduler.run_cycle();

  fmt::print(fg(fmt::color::cyan),
             "=================== PENDING FILES ====================\n");
  for (const auto &root : dry.roots) {
    auto it = report.pending_by_root.find(root);
    fmt::print("{:<40} {:>10}\n", root,
               it == report.pending_by_root.end() ? 0 : it->second);
  }
  fmt::print("{:<40} {:>10}\n", "Total pending:", report.pending);
  fmt::print("{:<40} {:>10}\n", "Already processed:", report.already_processed);
  fmt::print("{:<40} {:>10}\n", "Output exists:", report.output_exists);
  fmt::print("{:<40} {:>10}\n", "Settling (too young):", report.too_young);
  fmt::print("{:<40} {:>10}\n", "Over transfer limit:", report.too_large);
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");
  return report.scan.roots_failed > 0 ? 1 : 0;
}

int cmd_stats(const Settings &settings) {
  ProcessedStore store(settings.state_dir);
  const size_t count = store.load(false);
  fmt::print("{:<25} {}\n", "State file:", store.path());
  fmt::print("{:<25} {}\n", "Processed files:", count);
  return 0;
}

int cmd_reset(const Settings &settings) {
  ProcessedStore store(settings.state_dir);
  const size_t before = store.load(false);
  if (settings.dry_run) {
    LOG_INFO("[dry-run] Would forget {} processed fingerprint(s) in {}", before,
             store.path());
    return 0;
  }
  std::string err;
  if (!store.reset(err)) {
    LOG_ERROR("Reset failed: {}", err);
    return 1;
  }
  LOG_SUCCESS("Forgot {} processed fingerprint(s) in {}", before, store.path());
  return 0;
}

void print_settings(const Settings &s) {
  fmt::print("{:<22} {}\n", "roots", join(s.roots, ":"));
  fmt::print("{:<22} {}\n", "extensions", join(s.include_extensions, ","));
  fmt::print("{:<22} {}\n", "exclude", join(s.exclude_patterns, ","));
  fmt::print("{:<22} {}\n", "output extension", s.output_extension);
  fmt::print("{:<22} {}\n", "max jobs", s.max_jobs);
  fmt::print("{:<22} {}s\n", "scan interval", s.scan_interval_sec);
  fmt::print("{:<22} {}s\n", "min file age", s.min_file_age_sec);
  fmt::print("{:<22} {}\n", "work dir", s.work_dir);
  fmt::print("{:<22} {}\n", "state dir", s.state_dir);
  fmt::print("{:<22} {}\n", "keep original", s.keep_original);
  fmt::print("{:<22} {}\n", "dry run", s.dry_run);
  fmt::print("{:<22} {}\n", "encoder",
             join(build_encoder_args(s.encoder, "<input>", "<output>"), " "));
  if (s.remote.enabled) {
    fmt::print("{:<22} {}@{}:{}\n", "remote", s.remote.user, s.remote.host,
               s.remote.port);
    fmt::print("{:<22} {}\n", "remote roots", join(s.remote.allowed_roots, ":"));
    fmt::print("{:<22} {}\n", "host key check",
               s.remote.verify_host_key ? "on" : "OFF");
  }
}

} // namespace vconv

/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex and runtime level
 *
 *          - Lifecycle event formatting
 *
 *          - TimingCollector static members and methods
 */

#include "vconv/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>

#include <fmt/color.h>
#include <fmt/core.h>

namespace vconv {

// **----- GLOBAL LOG STATE -----**

std::mutex log_mutex;

namespace {
std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};
} // anonymous namespace

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level));
}

LogLevel log_level() { return static_cast<LogLevel>(g_log_level.load()); }

bool parse_log_level(const std::string &name, LogLevel &out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") {
    out = LogLevel::Debug;
  } else if (lower == "info") {
    out = LogLevel::Info;
  } else if (lower == "warn" || lower == "warning") {
    out = LogLevel::Warn;
  } else if (lower == "error") {
    out = LogLevel::Error;
  } else {
    return false;
  }
  return true;
}

std::string log_timestamp() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  return buf;
}

// **----- LIFECYCLE EVENTS -----**

const char *event_name(LogEvent event) {
  switch (event) {
  case LogEvent::Discovered:
    return "discovered";
  case LogEvent::Claimed:
    return "claimed";
  case LogEvent::Converting:
    return "converting";
  case LogEvent::Committed:
    return "committed";
  case LogEvent::Failed:
    return "failed";
  case LogEvent::Skipped:
    return "skipped";
  case LogEvent::Abandoned:
    return "abandoned";
  }
  return "unknown";
}

LogLevel event_level(LogEvent event) {
  switch (event) {
  case LogEvent::Discovered:
  case LogEvent::Skipped:
    return LogLevel::Debug;
  case LogEvent::Failed:
  case LogEvent::Abandoned:
    return LogLevel::Warn;
  default:
    return LogLevel::Info;
  }
}

void log_event_line(LogEvent event, const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  const std::string ts = log_timestamp();
  switch (event) {
  case LogEvent::Committed:
    fmt::print(fg(fmt::color::green), "{} [INFO] [{}] {}\n", ts,
               event_name(event), message);
    break;
  case LogEvent::Failed:
  case LogEvent::Abandoned:
    fmt::print(fg(fmt::color::yellow), "{} [WARN] [{}] {}\n", ts,
               event_name(event), message);
    break;
  case LogEvent::Discovered:
  case LogEvent::Skipped:
    fmt::print(fg(fmt::color::gray), "{} [DEBUG] [{}] {}\n", ts,
               event_name(event), message);
    break;
  default:
    fmt::print("{} [INFO] [{}] {}\n", ts, event_name(event), message);
    break;
  }
  std::fflush(stdout);
}

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::map<std::string, TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  TimingEntry &e = entries[name];
  e.count++;
  e.total_us += us;
  e.max_us = std::max(e.max_us, us);
}

TimingEntry TimingCollector::get(const std::string &name) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  auto it = entries.find(name);
  return it == entries.end() ? TimingEntry{} : it->second;
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> timing_lock(timing_mutex);
  if (entries.empty())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "====================== TIMING SUMMARY ======================\n");
  fmt::print("{:<20} {:>8} {:>14} {:>14}\n", "Phase", "Count", "Avg [s]",
             "Max [s]");
  fmt::print("{:-<20} {:-<8} {:-<14} {:-<14}\n", "", "", "", "");

  for (const auto &kv : entries) {
    const TimingEntry &e = kv.second;
    double avg = e.count > 0 ? (e.total_us / 1000000.0) / e.count : 0.0;
    fmt::print("{:<20} {:>8} {:>14.2f} {:>14.2f}\n", kv.first, e.count, avg,
               e.max_us / 1000000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "============================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace vconv

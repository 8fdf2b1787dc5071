/**
 * @file logging.hpp
 * @brief Logging macros, lifecycle events and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time and runtime controlled logging macros (LOG_DEBUG,
 *            LOG_INFO, LOG_WARN, LOG_ERROR, LOG_PHASE, LOG_SUCCESS)
 *
 *          - LOG_EVENT for job lifecycle events with a stable [event] tag
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating phase durations
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately to ensure visibility in journald / container logs.
 *       Lines are written under a single mutex so output from concurrent
 *       workers never interleaves.
 */

#ifndef VCONV_LOGGING_HPP
#define VCONV_LOGGING_HPP

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace vconv {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

enum class LogLevel : std::uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/**
 * @brief Job lifecycle events emitted to the log sink.
 * @note The textual names are a stable contract for log scraping.
 */
enum class LogEvent : std::uint8_t {
  Discovered,
  Claimed,
  Converting,
  Committed,
  Failed,
  Skipped,
  Abandoned
};

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/**
 * @brief Set the runtime minimum level.
 * @note Messages below this level are dropped before formatting.
 */
void set_log_level(LogLevel level);
LogLevel log_level();

/**
 * @brief Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
 * @return true if the name was recognized
 */
bool parse_log_level(const std::string &name, LogLevel &out);

inline bool log_enabled(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(log_level());
}

/// Local wall-clock time formatted as "YYYY-mm-dd HH:MM:SS"
std::string log_timestamp();

const char *event_name(LogEvent event);
LogLevel event_level(LogEvent event);

/**
 * @brief Write one preformatted lifecycle event line.
 * @note Takes log_mutex; called through LOG_EVENT.
 */
void log_event_line(LogEvent event, const std::string &message);

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (vconv::log_enabled(vconv::LogLevel::Debug)) {                          \
      std::lock_guard<std::mutex> lock(vconv::log_mutex);                      \
      fmt::print(fg(fmt::color::gray), "{} [DEBUG] " format_str "\n",          \
                 vconv::log_timestamp(), ##__VA_ARGS__);                       \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    if (vconv::log_enabled(vconv::LogLevel::Info)) {                           \
      std::lock_guard<std::mutex> lock(vconv::log_mutex);                      \
      fmt::print("{} [INFO] " format_str "\n", vconv::log_timestamp(),         \
                 ##__VA_ARGS__);                                               \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    if (vconv::log_enabled(vconv::LogLevel::Warn)) {                           \
      std::lock_guard<std::mutex> lock(vconv::log_mutex);                      \
      fmt::print(fg(fmt::color::yellow), "{} [WARN] " format_str "\n",         \
                 vconv::log_timestamp(), ##__VA_ARGS__);                       \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    if (vconv::log_enabled(vconv::LogLevel::Error)) {                          \
      std::lock_guard<std::mutex> lock(vconv::log_mutex);                      \
      fmt::print(fg(fmt::color::red), "{} [ERROR] " format_str "\n",           \
                 vconv::log_timestamp(), ##__VA_ARGS__);                       \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    if (vconv::log_enabled(vconv::LogLevel::Info)) {                           \
      std::lock_guard<std::mutex> lock(vconv::log_mutex);                      \
      fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);        \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    if (vconv::log_enabled(vconv::LogLevel::Info)) {                           \
      std::lock_guard<std::mutex> lock(vconv::log_mutex);                      \
      fmt::print(fg(fmt::color::green), "{} [INFO] " format_str "\n",          \
                 vconv::log_timestamp(), ##__VA_ARGS__);                       \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_EVENT(event, format_str, ...)                                      \
  do {                                                                         \
    if (vconv::log_enabled(vconv::event_level(event))) {                       \
      vconv::log_event_line(event, fmt::format(format_str, ##__VA_ARGS__));    \
    }                                                                          \
  } while (0)
#else
#define LOG_DEBUG(...) ((void)0)
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#define LOG_EVENT(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: aggregated measurements for one phase.
 */
struct TimingEntry {
  long count = 0;        //< Number of samples
  long total_us = 0;     //< Sum of durations in microseconds
  long max_us = 0;       //< Longest single sample
};

/**
 * @class TimingCollector
 * @brief Thread-safe singleton for aggregating phase timings.
 * @note Every worker records its download/encode/commit durations here; the
 *       daemon prints the table once at shutdown.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::map<std::string, TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /// Copy of the aggregate for one phase (zeroed if never recorded)
  static TimingEntry get(const std::string &name);

  /**
   * @brief Print all aggregated timings as a formatted table.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    vconv::TimingCollector::record(#name, timer_duration_##name);              \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace vconv

#endif // VCONV_LOGGING_HPP

/**
 * @file main.cpp
 * @brief Entry point for the vconvd daemon
 *
 * @details Main entry point that handles:
 *
 *          - Subcommand selection (run, once, pending, stats, reset,
 *            check-config) and --dry-run
 *
 *          - Loading and validating VCONV_* settings (exit 2 on error)
 *
 *          - SIGINT/SIGTERM -> cooperative shutdown of the scheduler
 *
 * @note Configuration is environment only; see config/vconv.env.
 */

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include "vconv/commands.hpp"
#include "vconv/config.hpp"
#include "vconv/logging.hpp"

using namespace vconv;

namespace {

std::atomic<bool> g_stop{false};

extern "C" void handle_stop_signal(int) { g_stop.store(true); }

void install_signal_handlers() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = handle_stop_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  /// A dropped SSH connection must surface as an error, not kill us
  std::signal(SIGPIPE, SIG_IGN);
}

void print_usage() {
  LOG_WARN("Usage: vconvd [run|once|pending|stats|reset|check-config] "
           "[--dry-run]");
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  std::string command = "run";
  bool force_dry_run = false;
  bool command_seen = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--dry-run") {
      force_dry_run = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else if (!command_seen && !arg.empty() && arg.front() != '-') {
      command = arg;
      command_seen = true;
    } else {
      print_usage();
      return EXIT_CONFIG_ERROR;
    }
  }

  const std::string level_name =
      Config::get_env_string("VCONV_LOG_LEVEL", "info");
  LogLevel level;
  if (parse_log_level(level_name, level)) {
    set_log_level(level);
  } else {
    LOG_WARN("Unknown VCONV_LOG_LEVEL '{}', using info", level_name);
  }

  // **---- CONFIGURATION ----**

  Settings settings;
  try {
    settings = load_settings_from_env();
  } catch (const std::invalid_argument &e) {
    LOG_ERROR("ConfigError: {}", e.what());
    return EXIT_CONFIG_ERROR;
  }
  if (force_dry_run)
    settings.dry_run = true;

  const std::vector<std::string> errors = validate_settings(settings);
  if (!errors.empty()) {
    for (const auto &e : errors)
      LOG_ERROR("ConfigError: {}", e);
    return EXIT_CONFIG_ERROR;
  }

  if (command == "check-config") {
    print_settings(settings);
    LOG_SUCCESS("Configuration is valid");
    return 0;
  }
  if (command == "stats")
    return cmd_stats(settings);
  if (command == "reset")
    return cmd_reset(settings);
  if (command == "pending")
    return cmd_pending(settings);

  install_signal_handlers();

  if (command == "once")
    return cmd_once(settings, g_stop);
  if (command == "run")
    return cmd_run(settings, g_stop);

  LOG_ERROR("Unknown command '{}'", command);
  print_usage();
  return EXIT_CONFIG_ERROR;
}

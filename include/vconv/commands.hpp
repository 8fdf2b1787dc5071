/**
 * @file commands.hpp
 * @brief vconvd subcommands
 *
 * @details Each command takes validated Settings and returns the process
 *          exit code:
 *
 *          - run: daemon loop until SIGINT/SIGTERM
 *
 *          - once: one scan cycle, wait for its Jobs
 *
 *          - pending: dry-run discovery, per-root pending counts
 *
 *          - stats: number of committed fingerprints
 *
 *          - reset: rewrite the state file to an empty array
 */

#ifndef VCONV_COMMANDS_HPP
#define VCONV_COMMANDS_HPP

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "transfer_backend.hpp"

namespace vconv {

/// Exit code for configuration errors
constexpr int EXIT_CONFIG_ERROR = 2;

/**
 * @brief Build the backend for the configured mode.
 * @note The SFTP backend connects eagerly; a failed first connect is logged
 *       and retried by the next operation.
 */
std::unique_ptr<TransferBackend> make_backend(const Settings &settings);

int cmd_run(const Settings &settings, const std::atomic<bool> &stop_flag);
int cmd_once(const Settings &settings, const std::atomic<bool> &stop_flag);
int cmd_pending(const Settings &settings);
int cmd_stats(const Settings &settings);
int cmd_reset(const Settings &settings);

/// Print the effective settings (check-config)
void print_settings(const Settings &settings);

} // namespace vconv

#endif // VCONV_COMMANDS_HPP

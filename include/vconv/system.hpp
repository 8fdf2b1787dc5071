/**
 * @file system.hpp
 * @brief System utilities: CPU detection, durable file I/O, formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers (used to size
 *            the worker pool when VCONV_MAX_JOBS=0)
 *
 *          - fsync helpers for crash-safe write-temp-then-rename sequences
 *
 *          - Time and size formatting utilities
 */

#ifndef VCONV_SYSTEM_HPP
#define VCONV_SYSTEM_HPP

#include <cstdint>
#include <string>

namespace vconv {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the cgroup limit. This function reads cgroup
 *       files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cpuset: `cpuset.cpus.effective` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

// **---- Durable I/O ----**

/**
 * @brief Flush a file's data and metadata to stable storage.
 * @param path File to fsync
 * @param err Output: error description on failure
 * @return true on success
 */
bool fsync_path(const std::string &path, std::string &err);

/**
 * @brief Flush a directory entry table (makes a rename durable).
 * @note Failures are reported but callers may treat them as warnings on
 *       filesystems that refuse O_DIRECTORY fsync.
 */
bool fsync_directory(const std::string &dir, std::string &err);

/**
 * @brief Write a whole buffer to path via temp file, fsync and rename.
 *
 * @details The temp file lives in the same directory as path so the final
 *          rename is atomic. A crash at any point leaves either the old or
 *          the new content at path, never a prefix of the new one.
 *
 * @return true on success; on failure the temp file is removed
 */
bool write_file_atomic(const std::string &path, const std::string &content,
                       std::string &err);

/// strerror(errno) as std::string
std::string errno_string(int err_no);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 */
std::string format_time(double seconds);

/**
 * @brief Format a byte count as a human readable string ("1.5 GB").
 */
std::string format_bytes(std::uint64_t bytes);

} // namespace vconv

#endif // VCONV_SYSTEM_HPP

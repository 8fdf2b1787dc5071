/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - fsync and atomic whole-file replacement
 *
 *          - Time and size formatting utilities
 */

#include "vconv/system.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

#include "vconv/logging.hpp"

namespace vconv {

// **---- Internal Helpers ----**

namespace {

/// CPUs granted by a CFS quota, rounded up (-1 if unlimited or unreadable)
int cpus_from_quota(long quota, long period) {
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

/// cgroup v2: "<quota> <period>" or "max <period>"
int read_cpu_max(const char *path) {
  std::ifstream f(path);
  std::string quota, period;
  if (!(f >> quota >> period) || quota == "max")
    return -1;
  try {
    return cpus_from_quota(std::stol(quota), std::stol(period));
  } catch (const std::exception &) {
    return -1;
  }
}

/// cgroup v1: quota and period live in separate files
int read_cfs_quota(const char *quota_path, const char *period_path) {
  std::ifstream q(quota_path), p(period_path);
  long quota = -1, period = -1;
  if (!(q >> quota) || !(p >> period))
    return -1;
  return cpus_from_quota(quota, period);
}

/// Number of CPUs in a cpuset list such as "0-3,8,10-11"
int count_cpuset(const char *path) {
  std::ifstream f(path);
  std::string line;
  if (!std::getline(f, line) || line.empty())
    return -1;

  int count = 0;
  std::stringstream ranges(line);
  std::string range;
  try {
    while (std::getline(ranges, range, ',')) {
      const size_t dash = range.find('-');
      if (dash == std::string::npos) {
        ++count;
      } else {
        count += std::stoi(range.substr(dash + 1)) -
                 std::stoi(range.substr(0, dash)) + 1;
      }
    }
  } catch (const std::exception &) {
    return -1;
  }
  return count > 0 ? count : -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  /// Quota first (v2, then v1), then the cpuset, then the hardware
  int limit = read_cpu_max("/sys/fs/cgroup/cpu.max");
  if (limit <= 0)
    limit = read_cfs_quota("/sys/fs/cgroup/cpu/cpu.cfs_quota_us",
                           "/sys/fs/cgroup/cpu/cpu.cfs_period_us");
  if (limit <= 0)
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
  if (limit <= 0)
    limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  if (limit <= 0)
    limit = 2;
  return std::min(limit, 64);
}

// **---- Durable I/O ----**

std::string errno_string(int err_no) { return std::strerror(err_no); }

bool fsync_path(const std::string &path, std::string &err) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    err = fmt::format("open {} for fsync: {}", path, errno_string(errno));
    return false;
  }
  bool ok = (::fsync(fd) == 0);
  if (!ok)
    err = fmt::format("fsync {}: {}", path, errno_string(errno));
  ::close(fd);
  return ok;
}

bool fsync_directory(const std::string &dir, std::string &err) {
  int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    err = fmt::format("open dir {}: {}", dir, errno_string(errno));
    return false;
  }
  bool ok = (::fsync(fd) == 0);
  if (!ok)
    err = fmt::format("fsync dir {}: {}", dir, errno_string(errno));
  ::close(fd);
  return ok;
}

bool write_file_atomic(const std::string &path, const std::string &content,
                       std::string &err) {
  const std::string tmp = fmt::format("{}.tmp.{}", path, ::getpid());

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    err = fmt::format("create {}: {}", tmp, errno_string(errno));
    return false;
  }

  const char *p = content.data();
  size_t remain = content.size();
  while (remain > 0) {
    ssize_t w = ::write(fd, p, remain);
    if (w < 0) {
      if (errno == EINTR)
        continue;
      err = fmt::format("write {}: {}", tmp, errno_string(errno));
      ::close(fd);
      ::unlink(tmp.c_str());
      return false;
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }

  if (::fsync(fd) != 0) {
    err = fmt::format("fsync {}: {}", tmp, errno_string(errno));
    ::close(fd);
    ::unlink(tmp.c_str());
    return false;
  }
  if (::close(fd) != 0) {
    err = fmt::format("close {}: {}", tmp, errno_string(errno));
    ::unlink(tmp.c_str());
    return false;
  }

  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    err = fmt::format("rename {} -> {}: {}", tmp, path, errno_string(errno));
    ::unlink(tmp.c_str());
    return false;
  }

  /// Make the rename itself durable; the content already is
  const size_t slash = path.find_last_of('/');
  const std::string dir =
      slash == std::string::npos ? "." : (slash == 0 ? "/" : path.substr(0, slash));
  std::string dir_err;
  if (!fsync_directory(dir, dir_err)) {
    LOG_WARN("{}", dir_err);
  }
  return true;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_bytes(std::uint64_t bytes) {
  static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }
  if (unit == 0)
    return fmt::format("{} B", bytes);
  return fmt::format("{:.1f} {}", value, units[unit]);
}

} // namespace vconv

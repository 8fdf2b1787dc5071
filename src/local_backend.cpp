/**
 * @file local_backend.cpp
 * @brief Local filesystem TransferBackend implementation
 */

#include "vconv/local_backend.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

#include "vconv/logging.hpp"
#include "vconv/path_guard.hpp"
#include "vconv/system.hpp"
#include "vconv/types.hpp"

namespace vconv {

namespace fs = std::filesystem;

namespace {

void fill_entry(const struct stat &st, FileEntry &e) {
  e.is_dir = S_ISDIR(st.st_mode);
  e.is_regular = S_ISREG(st.st_mode);
  e.size = static_cast<std::uint64_t>(st.st_size);
  e.mtime = static_cast<std::int64_t>(st.st_mtime);
}

} // anonymous namespace

bool LocalBackend::list(const std::string &dir, std::vector<FileEntry> &out,
                        std::string &err) {
  out.clear();
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    err = fmt::format("cannot list {}: {}", dir, ec.message());
    return false;
  }

  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      err = fmt::format("error while listing {}: {}", dir, ec.message());
      return false;
    }
    FileEntry e;
    e.name = it->path().filename().string();

    struct stat st;
    const std::string full = it->path().string();
    if (::lstat(full.c_str(), &st) != 0)
      continue; //< Vanished between readdir and lstat
    fill_entry(st, e);
    e.is_symlink = S_ISLNK(st.st_mode);
    out.push_back(std::move(e));
  }
  if (ec) {
    err = fmt::format("error while listing {}: {}", dir, ec.message());
    return false;
  }
  return true;
}

bool LocalBackend::stat(const std::string &path, FileEntry &out,
                        std::string &err) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    if (errno == ENOENT || errno == ENOTDIR) {
      err.clear();
    } else {
      err = fmt::format("stat {}: {}", path, errno_string(errno));
    }
    return false;
  }
  out.name = fs::path(path).filename().string();
  out.is_symlink = false;
  fill_entry(st, out);
  return true;
}

bool LocalBackend::realpath(const std::string &path, std::string &out,
                            std::string &err) {
  char buf[PATH_MAX];
  if (!::realpath(path.c_str(), buf)) {
    err = fmt::format("realpath {}: {}", path, errno_string(errno));
    return false;
  }
  out = buf;
  return true;
}

bool LocalBackend::fetch(const std::string &path, const std::string &local_path,
                         const AbortCheck &should_abort, std::string &err) {
  return copy_file_durable(path, local_path, should_abort, err);
}

bool LocalBackend::put(const std::string &local_path, const std::string &path,
                       const AbortCheck &should_abort, std::string &err) {
  if (::rename(local_path.c_str(), path.c_str()) == 0)
    return true;
  if (errno != EXDEV) {
    err = fmt::format("move {} -> {}: {}", local_path, path,
                      errno_string(errno));
    return false;
  }
  /// Work directory on another filesystem: copy into the temporary name
  return copy_file_durable(local_path, path, should_abort, err);
}

bool LocalBackend::rename(const std::string &from, const std::string &to,
                          std::string &err) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    err = fmt::format("rename {} -> {}: {}", from, to, errno_string(errno));
    return false;
  }
  std::string dir_err;
  if (!fsync_directory(parent_path(to), dir_err)) {
    /// The rename itself succeeded
    LOG_WARN("{}", dir_err);
  }
  return true;
}

bool LocalBackend::remove(const std::string &path, std::string &err) {
  if (::unlink(path.c_str()) != 0) {
    err = fmt::format("unlink {}: {}", path, errno_string(errno));
    return false;
  }
  return true;
}

bool LocalBackend::set_mtime(const std::string &path, std::int64_t mtime,
                             std::string &err) {
  struct timespec times[2];
  times[0].tv_sec = 0;
  times[0].tv_nsec = UTIME_OMIT; //< Leave atime alone
  times[1].tv_sec = static_cast<time_t>(mtime);
  times[1].tv_nsec = 0;
  if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
    err = fmt::format("utimensat {}: {}", path, errno_string(errno));
    return false;
  }
  return true;
}

// **---- Copy ----**

bool copy_file_durable(const std::string &src, const std::string &dst,
                       const AbortCheck &should_abort, std::string &err) {
  int in = ::open(src.c_str(), O_RDONLY | O_CLOEXEC);
  if (in < 0) {
    err = fmt::format("open {}: {}", src, errno_string(errno));
    return false;
  }
  int out = ::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (out < 0) {
    err = fmt::format("create {}: {}", dst, errno_string(errno));
    ::close(in);
    return false;
  }

  auto fail = [&](const std::string &what) {
    err = fmt::format("{}: {}", what, errno_string(errno));
    ::close(in);
    ::close(out);
    ::unlink(dst.c_str());
    return false;
  };

  std::vector<char> buf(TRANSFER_CHUNK_SIZE);
  while (true) {
    if (should_abort && should_abort()) {
      err = fmt::format("{} -> {}: {}", src, dst, TRANSFER_CANCELLED);
      ::close(in);
      ::close(out);
      ::unlink(dst.c_str());
      return false;
    }
    ssize_t n = ::read(in, buf.data(), buf.size());
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return fail("read " + src);
    }
    if (n == 0)
      break;
    const char *p = buf.data();
    size_t remain = static_cast<size_t>(n);
    while (remain > 0) {
      ssize_t w = ::write(out, p, remain);
      if (w < 0) {
        if (errno == EINTR)
          continue;
        return fail("write " + dst);
      }
      p += w;
      remain -= static_cast<size_t>(w);
    }
  }

  if (::fsync(out) != 0)
    return fail("fsync " + dst);
  ::close(in);
  if (::close(out) != 0) {
    err = fmt::format("close {}: {}", dst, errno_string(errno));
    ::unlink(dst.c_str());
    return false;
  }
  return true;
}

} // namespace vconv

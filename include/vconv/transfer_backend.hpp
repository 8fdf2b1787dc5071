/**
 * @file transfer_backend.hpp
 * @brief File capability surface shared by the local and SFTP backends
 *
 * @details Scanner, Scheduler and Committer are written against this
 *          interface only. Every operation reports failure as a false return
 *          plus a human readable message in err.
 */

#ifndef VCONV_TRANSFER_BACKEND_HPP
#define VCONV_TRANSFER_BACKEND_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace vconv {

/// Polled between transfer chunks; true cancels the transfer
using AbortCheck = std::function<bool()>;

/// Error text of a transfer stopped by its AbortCheck
inline constexpr const char *TRANSFER_CANCELLED = "transfer cancelled for shutdown";

/**
 * @struct FileEntry
 * @brief One directory entry or stat result.
 * @note For list(), type flags describe the entry itself (symlinks are not
 *       followed). For stat(), symlinks are followed.
 */
struct FileEntry {
  std::string name;
  bool is_dir = false;
  bool is_regular = false;
  bool is_symlink = false;
  std::uint64_t size = 0;
  std::int64_t mtime = 0; //< Epoch seconds
};

class TransferBackend {
public:
  virtual ~TransferBackend() = default;

  /// Short name for logs ("local", "sftp://host")
  virtual std::string describe() const = 0;

  /// true if files must be staged into the work directory before encoding
  virtual bool is_remote() const = 0;

  /// Largest file this backend will transfer (0 = unlimited)
  virtual std::uint64_t max_transfer_bytes() const = 0;

  /// List a directory, "." and ".." excluded
  virtual bool list(const std::string &dir, std::vector<FileEntry> &out,
                    std::string &err) = 0;

  /**
   * @brief Stat a path, following symlinks.
   * @return false with empty err if the path does not exist
   */
  virtual bool stat(const std::string &path, FileEntry &out,
                    std::string &err) = 0;

  /// Resolve symlinks and relative segments to an absolute path
  virtual bool realpath(const std::string &path, std::string &out,
                        std::string &err) = 0;

  /**
   * @brief Copy a backend file to a local path (open-read).
   * @note On failure nothing is left at local_path. A true should_abort
   *       stops the copy with TRANSFER_CANCELLED.
   */
  virtual bool fetch(const std::string &path, const std::string &local_path,
                     const AbortCheck &should_abort, std::string &err) = 0;

  /**
   * @brief Place a local file at a backend path (open-write).
   * @note Callers pass a temporary name and finalize with rename(). The
   *       local file may be consumed. Cancellation as for fetch().
   */
  virtual bool put(const std::string &local_path, const std::string &path,
                   const AbortCheck &should_abort, std::string &err) = 0;

  /// Atomically rename, replacing any existing target
  virtual bool rename(const std::string &from, const std::string &to,
                      std::string &err) = 0;

  virtual bool remove(const std::string &path, std::string &err) = 0;

  virtual bool set_mtime(const std::string &path, std::int64_t mtime,
                         std::string &err) = 0;
};

} // namespace vconv

#endif // VCONV_TRANSFER_BACKEND_HPP

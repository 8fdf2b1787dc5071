/**
 * @file local_backend.hpp
 * @brief Direct filesystem TransferBackend
 */

#ifndef VCONV_LOCAL_BACKEND_HPP
#define VCONV_LOCAL_BACKEND_HPP

#include "transfer_backend.hpp"

namespace vconv {

/**
 * @class LocalBackend
 * @brief TransferBackend over the local filesystem.
 *
 * @note put() renames the local file into place when source and target
 *       share a filesystem and falls back to a chunked copy + fsync across
 *       devices. Either way the target name is a temporary one chosen by the
 *       committer, so the final path only appears through rename().
 */
class LocalBackend : public TransferBackend {
public:
  std::string describe() const override { return "local"; }
  bool is_remote() const override { return false; }
  std::uint64_t max_transfer_bytes() const override { return 0; }

  bool list(const std::string &dir, std::vector<FileEntry> &out,
            std::string &err) override;
  bool stat(const std::string &path, FileEntry &out, std::string &err) override;
  bool realpath(const std::string &path, std::string &out,
                std::string &err) override;
  bool fetch(const std::string &path, const std::string &local_path,
             const AbortCheck &should_abort, std::string &err) override;
  bool put(const std::string &local_path, const std::string &path,
           const AbortCheck &should_abort, std::string &err) override;
  bool rename(const std::string &from, const std::string &to,
              std::string &err) override;
  bool remove(const std::string &path, std::string &err) override;
  bool set_mtime(const std::string &path, std::int64_t mtime,
                 std::string &err) override;
};

/**
 * @brief Copy src to dst in TRANSFER_CHUNK_SIZE chunks and fsync dst.
 * @note A partially written dst is removed on failure. should_abort is
 *       polled before every chunk and may be empty.
 */
bool copy_file_durable(const std::string &src, const std::string &dst,
                       const AbortCheck &should_abort, std::string &err);

} // namespace vconv

#endif // VCONV_LOCAL_BACKEND_HPP

/**
 * @file sftp_backend.hpp
 * @brief SFTP TransferBackend over libssh2
 *
 * @details Talks to one configured host using the SFTP subsystem only: no
 *          remote command is ever executed. Authentication is by private key
 *          file; the host key is checked against known_hosts.
 *
 * @attention PATH CONTAINMENT:
 *
 *   - Every path is lexically checked (absolute, no "..", inside a
 *     configured remote root) before any network I/O
 *
 *   - Paths that are read, written or deleted are additionally resolved
 *     with SFTP realpath and must still land inside a root
 */

#ifndef VCONV_SFTP_BACKEND_HPP
#define VCONV_SFTP_BACKEND_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <libssh2.h>
#include <libssh2_sftp.h>

#include "config.hpp"
#include "transfer_backend.hpp"

namespace vconv {

/**
 * @class SftpBackend
 * @brief Pool of SSH sessions, one per concurrent operation.
 *
 * @note An operation takes an idle session from the pool, or opens a new one,
 *       and runs without holding any backend lock, so a long download on one
 *       worker never stalls the scanner or another worker. Only the TCP
 *       connect, handshake and authentication of a new session are
 *       serialized. A session that drops mid-operation is discarded together
 *       with the idle ones, and the operation is retried once on a fresh
 *       session before the failure is reported.
 */
class SftpBackend : public TransferBackend {
public:
  explicit SftpBackend(const RemoteSettings &settings);
  ~SftpBackend() override;

  SftpBackend(const SftpBackend &) = delete;
  SftpBackend &operator=(const SftpBackend &) = delete;

  /// Open one session eagerly (otherwise the first operation connects)
  bool connect(std::string &err);
  /// Close idle sessions; sessions in use close when they are returned
  void disconnect();

  /// Sessions currently parked in the pool
  std::size_t idle_sessions();

  std::string describe() const override;
  bool is_remote() const override { return true; }
  std::uint64_t max_transfer_bytes() const override {
    return settings_.max_transfer_bytes;
  }

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

private:
  using Clock = std::chrono::steady_clock;

  /// One TCP connection with its SSH session and SFTP channel
  struct Session {
    int sock = -1;
    LIBSSH2_SESSION *ssh = nullptr;
    LIBSSH2_SFTP *sftp = nullptr;

    Session() = default;
    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;
    ~Session(); //< Shuts the channel down and closes the socket
  };

  RemoteSettings settings_;

  std::mutex pool_mutex_; //< Guards idle_
  std::vector<std::unique_ptr<Session>> idle_;

  std::mutex connect_mutex_; //< Serializes session setup
  bool announced_ = false;   //< First successful connect was logged

  std::mutex roots_mutex_; //< Guards resolved_roots_
  std::vector<std::string> resolved_roots_; //< Roots after server realpath

  // **---- Pool ----**
  std::unique_ptr<Session> acquire(std::string &err);
  void release(std::unique_ptr<Session> session);
  void drop_idle();

  // **---- Connection ----**
  bool open_session(Session &s, std::string &err);
  bool tcp_connect(Session &s, std::string &err);
  bool verify_host_key(Session &s, std::string &err);
  void resolve_roots(Session &s);
  static bool session_lost(const Session &s);
  static std::string last_error(const Session &s, const std::string &what);

  /**
   * @brief Run op on a pooled session, retrying once on a fresh session if
   *        the connection drops.
   * @param op Callable bool(Session &, std::string &err); no backend lock is
   *           held while it runs
   */
  template <typename Op>
  bool with_session(const char *what, Op op, std::string &err);

  // **---- Primitives ----**
  bool realpath_on(Session &s, const std::string &path, std::string &out,
                   std::string &err);
  bool stat_on(Session &s, const std::string &path, FileEntry &out,
               std::string &err);
  bool resolve_within_roots(Session &s, const std::string &path,
                            std::string &err);
};

} // namespace vconv

#endif // VCONV_SFTP_BACKEND_HPP

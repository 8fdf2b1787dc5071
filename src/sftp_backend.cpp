/**
 * @file sftp_backend.cpp
 * @brief libssh2 SFTP TransferBackend implementation
 *
 * @details Connection sequence:
 *
 *          - Non-blocking TCP connect bounded by the connect timeout, with
 *            TCP keepalive enabled
 *
 *          - SSH handshake, host key check against known_hosts
 *
 *          - Public key authentication from the configured key file
 *
 *          - SFTP subsystem start; the first session also resolves the
 *            roots on the server
 *
 *          Each pooled session runs this sequence on its own socket.
 */

#include "vconv/sftp_backend.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <vector>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <fmt/core.h>

#include "vconv/logging.hpp"
#include "vconv/path_guard.hpp"
#include "vconv/system.hpp"
#include "vconv/types.hpp"

namespace vconv {

namespace {

std::once_flag libssh2_once;
int libssh2_init_rc = 0;

bool ensure_libssh2(std::string &err) {
  std::call_once(libssh2_once, [] { libssh2_init_rc = libssh2_init(0); });
  if (libssh2_init_rc != 0) {
    err = fmt::format("libssh2_init failed (rc={})", libssh2_init_rc);
    return false;
  }
  return true;
}

void fill_entry(const LIBSSH2_SFTP_ATTRIBUTES &attrs, FileEntry &e) {
  if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
    const unsigned long type = attrs.permissions & LIBSSH2_SFTP_S_IFMT;
    e.is_dir = (type == LIBSSH2_SFTP_S_IFDIR);
    e.is_regular = (type == LIBSSH2_SFTP_S_IFREG);
    e.is_symlink = (type == LIBSSH2_SFTP_S_IFLNK);
  }
  if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
    e.size = attrs.filesize;
  if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
    e.mtime = static_cast<std::int64_t>(attrs.mtime);
}

/// Map a libssh2 host key type onto the matching known_hosts key type
int knownhost_key_type(int hostkey_type) {
  switch (hostkey_type) {
  case LIBSSH2_HOSTKEY_TYPE_RSA:
    return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
  case LIBSSH2_HOSTKEY_TYPE_DSS:
    return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
  case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
    return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
  case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
    return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
  case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
    return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
  case LIBSSH2_HOSTKEY_TYPE_ED25519:
    return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
  default:
    return 0;
  }
}

} // anonymous namespace

SftpBackend::Session::~Session() {
  if (sftp)
    libssh2_sftp_shutdown(sftp);
  if (ssh) {
    libssh2_session_disconnect(ssh, "vconvd shutdown");
    libssh2_session_free(ssh);
  }
  if (sock >= 0)
    ::close(sock);
}

SftpBackend::SftpBackend(const RemoteSettings &settings)
    : settings_(settings) {}

SftpBackend::~SftpBackend() { disconnect(); }

std::string SftpBackend::describe() const {
  return fmt::format("sftp://{}@{}:{}", settings_.user, settings_.host,
                     settings_.port);
}

bool SftpBackend::connect(std::string &err) {
  auto session = acquire(err);
  if (!session)
    return false;
  release(std::move(session));
  return true;
}

void SftpBackend::disconnect() { drop_idle(); }

std::size_t SftpBackend::idle_sessions() {
  std::lock_guard<std::mutex> lock(pool_mutex_);
  return idle_.size();
}

// **---- Pool ----**

std::unique_ptr<SftpBackend::Session> SftpBackend::acquire(std::string &err) {
  {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (!idle_.empty()) {
      auto session = std::move(idle_.back());
      idle_.pop_back();
      return session;
    }
  }

  /// Pool empty: open a new session without holding pool_mutex_
  auto session = std::make_unique<Session>();
  if (!open_session(*session, err))
    return nullptr;
  return session;
}

void SftpBackend::release(std::unique_ptr<Session> session) {
  std::lock_guard<std::mutex> lock(pool_mutex_);
  idle_.push_back(std::move(session));
}

void SftpBackend::drop_idle() {
  std::vector<std::unique_ptr<Session>> doomed;
  {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    doomed.swap(idle_);
  }
  /// Sessions close here, outside the pool lock
}

// **---- Connection ----**

bool SftpBackend::tcp_connect(Session &s, std::string &err) {
  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  const std::string port = std::to_string(settings_.port);
  struct addrinfo *res = nullptr;
  int gai = ::getaddrinfo(settings_.host.c_str(), port.c_str(), &hints, &res);
  if (gai != 0) {
    err = fmt::format("getaddrinfo {}: {}", settings_.host, gai_strerror(gai));
    return false;
  }

  const int timeout_ms = settings_.connect_timeout_sec * 1000;
  std::string last = "no usable address";
  for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
    int fd = ::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC,
                      rp->ai_protocol);
    if (fd < 0)
      continue;

    int on = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
    int idle = 60, intvl = 10, cnt = 3;
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));

    /// Non-blocking connect so the connect timeout is enforced
    const int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    int rc = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
    if (rc != 0 && errno == EINPROGRESS) {
      struct pollfd pfd;
      pfd.fd = fd;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      rc = ::poll(&pfd, 1, timeout_ms);
      if (rc == 0) {
        last = "connect timed out";
        rc = -1;
      } else if (rc > 0) {
        int so_err = 0;
        socklen_t len = sizeof(so_err);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &len);
        rc = so_err == 0 ? 0 : -1;
        if (so_err != 0)
          last = errno_string(so_err);
      } else {
        last = errno_string(errno);
        rc = -1;
      }
    } else if (rc != 0) {
      last = errno_string(errno);
    }

    if (rc == 0) {
      ::fcntl(fd, F_SETFL, flags);
      s.sock = fd;
      ::freeaddrinfo(res);
      return true;
    }
    ::close(fd);
  }
  ::freeaddrinfo(res);
  err = fmt::format("cannot connect to {}:{}: {}", settings_.host,
                    settings_.port, last);
  return false;
}

bool SftpBackend::verify_host_key(Session &s, std::string &err) {
  if (!settings_.verify_host_key) {
    if (!announced_)
      LOG_WARN("Host key verification disabled for {}", settings_.host);
    return true;
  }

  std::string path = settings_.known_hosts_path;
  if (path.empty()) {
    const char *home = std::getenv("HOME");
    if (home)
      path = std::string(home) + "/.ssh/known_hosts";
  }
  if (path.empty()) {
    err = "no known_hosts file (set VCONV_KNOWN_HOSTS)";
    return false;
  }

  LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(s.ssh);
  if (!nh) {
    err = "libssh2_knownhost_init failed";
    return false;
  }
  if (libssh2_knownhost_readfile(nh, path.c_str(),
                                 LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
    libssh2_knownhost_free(nh);
    err = fmt::format("cannot read known_hosts {}", path);
    return false;
  }

  size_t keylen = 0;
  int keytype = 0;
  const char *key = libssh2_session_hostkey(s.ssh, &keylen, &keytype);
  if (!key || keylen == 0) {
    libssh2_knownhost_free(nh);
    err = "server sent no host key";
    return false;
  }
  const int alg = knownhost_key_type(keytype);
  if (alg == 0) {
    libssh2_knownhost_free(nh);
    err = fmt::format("unsupported host key type {}", keytype);
    return false;
  }

  struct libssh2_knownhost *match = nullptr;
  const int check = libssh2_knownhost_checkp(
      nh, settings_.host.c_str(), settings_.port, key, keylen,
      LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
      &match);
  libssh2_knownhost_free(nh);

  switch (check) {
  case LIBSSH2_KNOWNHOST_CHECK_MATCH:
    return true;
  case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
    err = fmt::format("host key MISMATCH for {} (known_hosts {})",
                      settings_.host, path);
    return false;
  case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
    err = fmt::format("host {} not present in {}", settings_.host, path);
    return false;
  default:
    err = fmt::format("host key check failed for {}", settings_.host);
    return false;
  }
}

bool SftpBackend::open_session(Session &s, std::string &err) {
  std::lock_guard<std::mutex> lock(connect_mutex_);
  if (!ensure_libssh2(err))
    return false;
  if (!tcp_connect(s, err))
    return false;

  s.ssh = libssh2_session_init();
  if (!s.ssh) {
    err = "libssh2_session_init failed";
    return false;
  }
  libssh2_session_set_blocking(s.ssh, 1);
  libssh2_session_set_timeout(s.ssh, settings_.connect_timeout_sec * 1000L);

  if (libssh2_session_handshake(s.ssh, s.sock) != 0) {
    err = last_error(s, "SSH handshake");
    return false;
  }
  libssh2_keepalive_config(s.ssh, 1, 30);

  if (!verify_host_key(s, err))
    return false;

  if (libssh2_userauth_publickey_fromfile(s.ssh, settings_.user.c_str(),
                                          nullptr, settings_.key_path.c_str(),
                                          nullptr) != 0) {
    err = last_error(s, fmt::format("public key auth as {} with {}",
                                    settings_.user, settings_.key_path));
    return false;
  }

  s.sftp = libssh2_sftp_init(s.ssh);
  if (!s.sftp) {
    err = last_error(s, "SFTP subsystem start");
    return false;
  }

  if (!announced_) {
    resolve_roots(s);
    announced_ = true;
    LOG_SUCCESS("Connected to {}", describe());
  } else {
    LOG_DEBUG("Opened another SFTP session to {}", describe());
  }
  return true;
}

void SftpBackend::resolve_roots(Session &s) {
  /// Roots may themselves be symlinks on the server
  std::vector<std::string> resolved;
  for (const auto &root : settings_.allowed_roots) {
    std::string out, rerr;
    if (realpath_on(s, root, out, rerr)) {
      resolved.push_back(out);
    } else {
      LOG_WARN("Remote root {} does not resolve: {}", root, rerr);
    }
  }
  std::lock_guard<std::mutex> lock(roots_mutex_);
  resolved_roots_ = std::move(resolved);
}

bool SftpBackend::session_lost(const Session &s) {
  if (!s.ssh)
    return true;
  switch (libssh2_session_last_errno(s.ssh)) {
  case LIBSSH2_ERROR_SOCKET_SEND:
  case LIBSSH2_ERROR_SOCKET_RECV:
  case LIBSSH2_ERROR_SOCKET_DISCONNECT:
  case LIBSSH2_ERROR_SOCKET_TIMEOUT:
  case LIBSSH2_ERROR_TIMEOUT:
  case LIBSSH2_ERROR_SOCKET_NONE:
    return true;
  default:
    return false;
  }
}

std::string SftpBackend::last_error(const Session &s, const std::string &what) {
  if (!s.ssh)
    return what + ": no session";
  char *msg = nullptr;
  int len = 0;
  const int rc = libssh2_session_last_error(s.ssh, &msg, &len, 0);
  if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && s.sftp) {
    return fmt::format("{}: SFTP status {}", what,
                       libssh2_sftp_last_error(s.sftp));
  }
  return fmt::format("{}: {} (rc={})", what, msg ? std::string(msg, len) : "",
                     rc);
}

template <typename Op>
bool SftpBackend::with_session(const char *what, Op op, std::string &err) {
  for (int attempt = 0; attempt < 2; ++attempt) {
    auto session = acquire(err);
    if (!session)
      return false;

    int next_keepalive = 0;
    libssh2_keepalive_send(session->ssh, &next_keepalive);

    err.clear();
    const bool ok = op(*session, err);
    if (ok || !session_lost(*session)) {
      release(std::move(session));
      return ok;
    }

    LOG_WARN("SFTP session lost during {} ({}), reconnecting", what, err);
    session.reset();
    /// Idle sessions share the dead link; do not hand them out again
    drop_idle();
  }
  return false;
}

// **---- Primitives ----**

bool SftpBackend::realpath_on(Session &s, const std::string &path,
                              std::string &out, std::string &err) {
  char buf[4096];
  int rc = libssh2_sftp_realpath(s.sftp, path.c_str(), buf, sizeof(buf) - 1);
  if (rc < 0) {
    err = last_error(s, "realpath " + path);
    return false;
  }
  out.assign(buf, static_cast<size_t>(rc));
  return true;
}

bool SftpBackend::stat_on(Session &s, const std::string &path, FileEntry &out,
                          std::string &err) {
  LIBSSH2_SFTP_ATTRIBUTES attrs;
  std::memset(&attrs, 0, sizeof(attrs));
  int rc = libssh2_sftp_stat_ex(s.sftp, path.c_str(),
                                static_cast<unsigned>(path.size()),
                                LIBSSH2_SFTP_STAT, &attrs);
  if (rc != 0) {
    const unsigned long status = libssh2_sftp_last_error(s.sftp);
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL &&
        (status == LIBSSH2_FX_NO_SUCH_FILE || status == LIBSSH2_FX_NO_SUCH_PATH)) {
      err.clear();
      return false;
    }
    err = last_error(s, "stat " + path);
    return false;
  }
  out = FileEntry();
  const size_t slash = path.find_last_of('/');
  out.name = slash == std::string::npos ? path : path.substr(slash + 1);
  fill_entry(attrs, out);
  out.is_symlink = false;
  return true;
}

bool SftpBackend::resolve_within_roots(Session &s, const std::string &path,
                                       std::string &err) {
  std::string resolved;
  if (!realpath_on(s, path, resolved, err))
    return false;
  if (path_within_roots(resolved, settings_.allowed_roots))
    return true;
  {
    std::lock_guard<std::mutex> lock(roots_mutex_);
    if (path_within_roots(resolved, resolved_roots_))
      return true;
  }
  err = fmt::format("{} resolves outside the remote roots ({})", path,
                    resolved);
  return false;
}

// **---- TransferBackend ----**

bool SftpBackend::list(const std::string &dir, std::vector<FileEntry> &out,
                       std::string &err) {
  if (!check_remote_path(dir, settings_.allowed_roots, err))
    return false;

  return with_session(
      "list",
      [&](Session &s, std::string &e) {
        out.clear();
        LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_opendir(s.sftp, dir.c_str());
        if (!h) {
          e = last_error(s, "opendir " + dir);
          return false;
        }

        char name[512];
        char longentry[1024];
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        while (true) {
          std::memset(&attrs, 0, sizeof(attrs));
          int rc = libssh2_sftp_readdir_ex(h, name, sizeof(name), longentry,
                                           sizeof(longentry), &attrs);
          if (rc == 0)
            break;
          if (rc < 0) {
            e = last_error(s, "readdir " + dir);
            libssh2_sftp_closedir(h);
            return false;
          }
          FileEntry fe;
          fe.name.assign(name, static_cast<size_t>(rc));
          if (fe.name == "." || fe.name == "..")
            continue;
          fill_entry(attrs, fe);
          out.push_back(std::move(fe));
        }
        libssh2_sftp_closedir(h);
        return true;
      },
      err);
}

bool SftpBackend::stat(const std::string &path, FileEntry &out,
                       std::string &err) {
  if (!check_remote_path(path, settings_.allowed_roots, err))
    return false;
  return with_session(
      "stat",
      [&](Session &s, std::string &e) { return stat_on(s, path, out, e); },
      err);
}

bool SftpBackend::realpath(const std::string &path, std::string &out,
                           std::string &err) {
  if (!check_remote_path(path, settings_.allowed_roots, err))
    return false;
  return with_session(
      "realpath",
      [&](Session &s, std::string &e) { return realpath_on(s, path, out, e); },
      err);
}

bool SftpBackend::fetch(const std::string &path, const std::string &local_path,
                        const AbortCheck &should_abort, std::string &err) {
  if (!check_remote_path(path, settings_.allowed_roots, err))
    return false;

  return with_session(
      "download",
      [&](Session &s, std::string &e) {
        if (!resolve_within_roots(s, path, e))
          return false;

        FileEntry info;
        if (!stat_on(s, path, info, e)) {
          if (e.empty())
            e = "remote file vanished: " + path;
          return false;
        }
        if (settings_.max_transfer_bytes > 0 &&
            info.size > settings_.max_transfer_bytes) {
          e = fmt::format("{} is {} which exceeds the transfer limit of {}",
                          path, format_bytes(info.size),
                          format_bytes(settings_.max_transfer_bytes));
          return false;
        }

        LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
            s.sftp, path.c_str(), static_cast<unsigned>(path.size()),
            LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
        if (!h) {
          e = last_error(s, "open " + path);
          return false;
        }
        int fd = ::open(local_path.c_str(),
                        O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
          e = fmt::format("create {}: {}", local_path, errno_string(errno));
          libssh2_sftp_close(h);
          return false;
        }

        auto fail = [&](const std::string &msg) {
          e = msg;
          libssh2_sftp_close(h);
          ::close(fd);
          ::unlink(local_path.c_str());
          return false;
        };

        const auto deadline =
            Clock::now() + std::chrono::seconds(settings_.transfer_timeout_sec);
        std::vector<char> buf(TRANSFER_CHUNK_SIZE);
        std::uint64_t total = 0;
        while (true) {
          if (should_abort && should_abort())
            return fail(fmt::format("download of {}: {}", path,
                                    TRANSFER_CANCELLED));
          if (Clock::now() > deadline)
            return fail(fmt::format("download of {} exceeded {}s", path,
                                    settings_.transfer_timeout_sec));
          ssize_t n = libssh2_sftp_read(h, buf.data(), buf.size());
          if (n == 0)
            break;
          if (n < 0)
            return fail(last_error(s, "read " + path));
          const char *p = buf.data();
          size_t remain = static_cast<size_t>(n);
          while (remain > 0) {
            ssize_t w = ::write(fd, p, remain);
            if (w < 0) {
              if (errno == EINTR)
                continue;
              return fail(fmt::format("write {}: {}", local_path,
                                      errno_string(errno)));
            }
            p += w;
            remain -= static_cast<size_t>(w);
          }
          total += static_cast<std::uint64_t>(n);
          if (settings_.max_transfer_bytes > 0 &&
              total > settings_.max_transfer_bytes)
            return fail(fmt::format("{} grew past the transfer limit", path));
        }
        libssh2_sftp_close(h);
        if (::fsync(fd) != 0 || ::close(fd) != 0) {
          e = fmt::format("flush {}: {}", local_path, errno_string(errno));
          ::unlink(local_path.c_str());
          return false;
        }
        LOG_DEBUG("Downloaded {} ({})", path, format_bytes(total));
        return true;
      },
      err);
}

bool SftpBackend::put(const std::string &local_path, const std::string &path,
                      const AbortCheck &should_abort, std::string &err) {
  if (!check_remote_path(path, settings_.allowed_roots, err))
    return false;

  return with_session(
      "upload",
      [&](Session &s, std::string &e) {
        if (!resolve_within_roots(s, parent_path(path), e))
          return false;

        int fd = ::open(local_path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
          e = fmt::format("open {}: {}", local_path, errno_string(errno));
          return false;
        }
        LIBSSH2_SFTP_HANDLE *h = libssh2_sftp_open_ex(
            s.sftp, path.c_str(), static_cast<unsigned>(path.size()),
            LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
            LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH,
            LIBSSH2_SFTP_OPENFILE);
        if (!h) {
          e = last_error(s, "open for write " + path);
          ::close(fd);
          return false;
        }

        auto fail = [&](const std::string &msg) {
          e = msg;
          libssh2_sftp_close(h);
          ::close(fd);
          /// Only the temporary name was written; drop it
          if (!session_lost(s) &&
              libssh2_sftp_unlink(s.sftp, path.c_str()) != 0) {
            LOG_WARN("Could not remove partial upload {}", path);
          }
          return false;
        };

        const auto deadline =
            Clock::now() + std::chrono::seconds(settings_.transfer_timeout_sec);
        std::vector<char> buf(TRANSFER_CHUNK_SIZE);
        std::uint64_t total = 0;
        while (true) {
          if (should_abort && should_abort())
            return fail(fmt::format("upload to {}: {}", path,
                                    TRANSFER_CANCELLED));
          ssize_t n = ::read(fd, buf.data(), buf.size());
          if (n < 0) {
            if (errno == EINTR)
              continue;
            return fail(fmt::format("read {}: {}", local_path,
                                    errno_string(errno)));
          }
          if (n == 0)
            break;
          const char *p = buf.data();
          size_t remain = static_cast<size_t>(n);
          while (remain > 0) {
            if (Clock::now() > deadline)
              return fail(fmt::format("upload to {} exceeded {}s", path,
                                      settings_.transfer_timeout_sec));
            ssize_t w = libssh2_sftp_write(h, p, remain);
            if (w < 0)
              return fail(last_error(s, "write " + path));
            p += w;
            remain -= static_cast<size_t>(w);
          }
          total += static_cast<std::uint64_t>(n);
        }
        ::close(fd);
        if (libssh2_sftp_close(h) != 0) {
          e = last_error(s, "close " + path);
          return false;
        }
        LOG_DEBUG("Uploaded {} ({})", path, format_bytes(total));
        return true;
      },
      err);
}

bool SftpBackend::rename(const std::string &from, const std::string &to,
                         std::string &err) {
  if (!check_remote_path(from, settings_.allowed_roots, err) ||
      !check_remote_path(to, settings_.allowed_roots, err))
    return false;

  return with_session(
      "rename",
      [&](Session &s, std::string &e) {
        if (!resolve_within_roots(s, parent_path(to), e))
          return false;
        const long flags = LIBSSH2_SFTP_RENAME_ATOMIC |
                           LIBSSH2_SFTP_RENAME_NATIVE |
                           LIBSSH2_SFTP_RENAME_OVERWRITE;
        if (libssh2_sftp_rename_ex(
                s.sftp, from.c_str(), static_cast<unsigned>(from.size()),
                to.c_str(), static_cast<unsigned>(to.size()), flags) != 0) {
          e = last_error(s, fmt::format("rename {} -> {}", from, to));
          return false;
        }
        return true;
      },
      err);
}

bool SftpBackend::remove(const std::string &path, std::string &err) {
  if (!check_remote_path(path, settings_.allowed_roots, err))
    return false;

  return with_session(
      "remove",
      [&](Session &s, std::string &e) {
        if (!resolve_within_roots(s, path, e))
          return false;
        if (libssh2_sftp_unlink(s.sftp, path.c_str()) != 0) {
          e = last_error(s, "unlink " + path);
          return false;
        }
        return true;
      },
      err);
}

bool SftpBackend::set_mtime(const std::string &path, std::int64_t mtime,
                            std::string &err) {
  if (!check_remote_path(path, settings_.allowed_roots, err))
    return false;

  return with_session(
      "set-mtime",
      [&](Session &s, std::string &e) {
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        std::memset(&attrs, 0, sizeof(attrs));
        /// SFTP v3 sets atime and mtime together; keep the current atime
        if (libssh2_sftp_stat_ex(s.sftp, path.c_str(),
                                 static_cast<unsigned>(path.size()),
                                 LIBSSH2_SFTP_STAT, &attrs) != 0) {
          e = last_error(s, "stat " + path);
          return false;
        }
        const unsigned long atime =
            (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
                ? attrs.atime
                : static_cast<unsigned long>(mtime);
        std::memset(&attrs, 0, sizeof(attrs));
        attrs.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
        attrs.atime = atime;
        attrs.mtime = static_cast<unsigned long>(mtime);
        if (libssh2_sftp_stat_ex(s.sftp, path.c_str(),
                                 static_cast<unsigned>(path.size()),
                                 LIBSSH2_SFTP_SETSTAT, &attrs) != 0) {
          e = last_error(s, "setstat " + path);
          return false;
        }
        return true;
      },
      err);
}

} // namespace vconv

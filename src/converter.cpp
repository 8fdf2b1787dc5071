/**
 * @file converter.cpp
 * @brief Encoder subprocess management
 */

#include "vconv/converter.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "vconv/logging.hpp"
#include "vconv/system.hpp"

namespace vconv {

namespace {

/// Interval between waitpid polls
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

/// Time the encoder gets to exit after SIGTERM before SIGKILL
constexpr auto TERM_GRACE = std::chrono::seconds(5);

/// Stop the child: SIGTERM, short wait, then SIGKILL
void terminate_child(pid_t pid) {
  ::kill(pid, SIGTERM);
  const auto until = std::chrono::steady_clock::now() + TERM_GRACE;
  int status = 0;
  while (std::chrono::steady_clock::now() < until) {
    if (::waitpid(pid, &status, WNOHANG) == pid)
      return;
    std::this_thread::sleep_for(POLL_INTERVAL);
  }
  LOG_WARN("Encoder pid {} ignored SIGTERM, sending SIGKILL", pid);
  ::kill(pid, SIGKILL);
  ::waitpid(pid, &status, 0);
}

} // anonymous namespace

const char *to_string(EncodeStatus status) {
  switch (status) {
  case EncodeStatus::Ok:
    return "ok";
  case EncodeStatus::Failed:
    return "failed";
  case EncodeStatus::TimedOut:
    return "timed out";
  case EncodeStatus::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

std::vector<std::string> build_encoder_args(const EncoderSettings &settings,
                                            const std::string &input_path,
                                            const std::string &output_path) {
  std::vector<std::string> args = {settings.ffmpeg_path,
                                   "-hide_banner",
                                   "-nostdin",
                                   "-loglevel",
                                   "error",
                                   "-i",
                                   input_path,
                                   "-c:v",
                                   settings.codec};
  if (settings.codec != "copy") {
    args.push_back("-crf");
    args.push_back(std::to_string(settings.crf));
    args.push_back("-preset");
    args.push_back(settings.preset);
  }
  args.push_back("-c:a");
  args.push_back(settings.audio_codec);
  if (settings.audio_codec != "copy") {
    args.push_back("-b:a");
    args.push_back(settings.audio_bitrate);
  }
  args.push_back("-y");
  args.push_back(output_path);
  return args;
}

EncodeStatus run_encoder(const EncoderSettings &settings,
                         const std::string &input_path,
                         const std::string &output_path,
                         const std::string &log_path,
                         const std::function<bool()> &should_abort,
                         std::string &err) {
  const std::vector<std::string> args =
      build_encoder_args(settings, input_path, output_path);

  /// Everything the child needs is prepared before fork
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &a : args)
    argv.push_back(const_cast<char *>(a.c_str()));
  argv.push_back(nullptr);

  int log_fd =
      ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (log_fd < 0) {
    err = fmt::format("open encoder log {}: {}", log_path, errno_string(errno));
    return EncodeStatus::Failed;
  }
  int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
  if (null_fd < 0) {
    err = fmt::format("open /dev/null: {}", errno_string(errno));
    ::close(log_fd);
    return EncodeStatus::Failed;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    err = fmt::format("fork: {}", errno_string(errno));
    ::close(log_fd);
    ::close(null_fd);
    return EncodeStatus::Failed;
  }
  if (pid == 0) {
    /// Child: only async-signal-safe calls from here on
    ::dup2(null_fd, STDIN_FILENO);
    ::dup2(null_fd, STDOUT_FILENO);
    ::dup2(log_fd, STDERR_FILENO);
    ::execvp(argv[0], argv.data());
    _exit(127);
  }
  ::close(log_fd);
  ::close(null_fd);

  LOG_DEBUG("Encoder pid {} started for {}", pid, input_path);

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(settings.timeout_sec);
  int status = 0;
  while (true) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid)
      break;
    if (r < 0 && errno != EINTR) {
      err = fmt::format("waitpid: {}", errno_string(errno));
      terminate_child(pid);
      return EncodeStatus::Failed;
    }
    if (should_abort && should_abort()) {
      terminate_child(pid);
      err = "encoder stopped for shutdown";
      return EncodeStatus::Cancelled;
    }
    if (std::chrono::steady_clock::now() > deadline) {
      terminate_child(pid);
      err = fmt::format("encoder exceeded {}s timeout", settings.timeout_sec);
      return EncodeStatus::TimedOut;
    }
    std::this_thread::sleep_for(POLL_INTERVAL);
  }

  if (WIFEXITED(status)) {
    const int code = WEXITSTATUS(status);
    if (code == 0)
      return EncodeStatus::Ok;
    err = code == 127
              ? fmt::format("encoder '{}' could not be executed (exit 127)",
                            settings.ffmpeg_path)
              : fmt::format("encoder exited with status {} (see {})", code,
                            log_path);
    return EncodeStatus::Failed;
  }
  if (WIFSIGNALED(status)) {
    err = fmt::format("encoder killed by signal {}", WTERMSIG(status));
    return EncodeStatus::Failed;
  }
  err = "encoder ended in an unknown state";
  return EncodeStatus::Failed;
}

EncodeStatus convert_file(const EncoderSettings &settings,
                          const std::string &input_path,
                          const std::string &output_path,
                          const std::string &log_path,
                          const std::function<bool()> &should_abort,
                          MediaInfo &info, std::string &err) {
  TIMER_START(encode);
  EncodeStatus status = run_encoder(settings, input_path, output_path,
                                    log_path, should_abort, err);
  TIMER_END(encode);
  if (status != EncodeStatus::Ok)
    return status;

  struct stat st;
  if (::stat(output_path.c_str(), &st) != 0) {
    err = fmt::format("encoder exited 0 but produced no output at {}",
                      output_path);
    return EncodeStatus::Failed;
  }
  if (st.st_size == 0) {
    err = fmt::format("encoder produced an empty file at {}", output_path);
    return EncodeStatus::Failed;
  }

  if (settings.verify_output) {
    TIMER_START(probe);
    const bool ok = probe_media(output_path, info, err);
    TIMER_END(probe);
    if (!ok)
      return EncodeStatus::Failed;
    LOG_INFO("Output {}: {} stream(s), {}, {}, {}", output_path, info.streams,
             info.format_name,
             info.video_codec.empty() ? "no video" : info.video_codec,
             format_time(info.duration_sec));
  }
  return EncodeStatus::Ok;
}

} // namespace vconv

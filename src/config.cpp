/**
 * @file config.cpp
 * @brief Environment loading and validation of Settings
 */

#include "vconv/config.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include <fmt/core.h>

#include "vconv/logging.hpp"
#include "vconv/path_guard.hpp"
#include "vconv/system.hpp"

namespace vconv {

namespace {

std::string trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(start, end - start);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool contains(const std::vector<std::string> &list, const std::string &v) {
  return std::find(list.begin(), list.end(), v) != list.end();
}

const std::vector<std::string> &default_extensions() {
  static const std::vector<std::string> exts = {
      "mp4", "mkv", "avi", "mov", "wmv", "flv", "webm", "ts"};
  return exts;
}

} // anonymous namespace

// **---- Environment helpers ----**

namespace Config {

bool get_env_bool(const char *name, bool default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  const std::string v = to_lower(trim(val));
  if (v == "1" || v == "true" || v == "yes" || v == "on")
    return true;
  if (v == "0" || v == "false" || v == "no" || v == "off")
    return false;
  throw std::invalid_argument(std::string(name) + " is not a boolean: '" +
                              val + "'");
}

std::vector<std::string> get_env_list(const char *name, char separator,
                                      const std::vector<std::string> &def) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return def;

  std::vector<std::string> out;
  std::string item;
  for (const char *p = val;; ++p) {
    if (*p == separator || *p == '\0') {
      std::string t = trim(item);
      if (!t.empty())
        out.push_back(t);
      item.clear();
      if (*p == '\0')
        break;
    } else {
      item += *p;
    }
  }
  return out;
}

} // namespace Config

// **---- Allow-lists ----**

bool is_allowed_codec(const std::string &codec) {
  static const std::vector<std::string> codecs = {
      "libx264", "libx265", "libvpx-vp9", "libaom-av1", "copy"};
  return contains(codecs, codec);
}

bool is_allowed_audio_codec(const std::string &codec) {
  static const std::vector<std::string> codecs = {"aac", "libopus",
                                                  "libmp3lame", "ac3", "copy"};
  return contains(codecs, codec);
}

bool is_allowed_preset(const std::string &preset) {
  static const std::vector<std::string> presets = {
      "ultrafast", "superfast", "veryfast", "faster", "fast",
      "medium",    "slow",      "slower",   "veryslow", "placebo"};
  return contains(presets, preset);
}

bool is_valid_audio_bitrate(const std::string &bitrate) {
  static const std::regex pattern("^[0-9]{1,4}k$");
  return std::regex_match(bitrate, pattern);
}

// **---- Loading ----**

Settings load_settings_from_env() {
  Settings s;

  s.roots = Config::get_env_list("VCONV_ROOTS", ':', {});
  s.include_extensions =
      Config::get_env_list("VCONV_EXTENSIONS", ',', default_extensions());
  s.exclude_patterns = Config::get_env_list("VCONV_EXCLUDE", ',', {});
  s.output_extension =
      Config::get_env_string("VCONV_OUTPUT_EXTENSION", s.output_extension);

  s.max_jobs = Config::get_env_int("VCONV_MAX_JOBS", s.max_jobs);
  if (s.max_jobs == 0) {
    /// 0 = auto, one job per available CPU
    s.max_jobs = std::min(detect_cpu_limit(), MAX_JOBS_LIMIT);
  }
  s.scan_interval_sec =
      Config::get_env_int("VCONV_SCAN_INTERVAL", s.scan_interval_sec);
  s.min_file_age_sec =
      Config::get_env_int("VCONV_MIN_FILE_AGE", s.min_file_age_sec);
  s.work_dir = Config::get_env_string("VCONV_WORK_DIR", s.work_dir);
  s.state_dir = Config::get_env_string("VCONV_STATE_DIR", s.state_dir);
  s.keep_original = Config::get_env_bool("VCONV_KEEP_ORIGINAL", true);
  s.dry_run = Config::get_env_bool("VCONV_DRY_RUN", false);
  s.shutdown_grace_sec =
      Config::get_env_int("VCONV_SHUTDOWN_GRACE", s.shutdown_grace_sec);
  s.failure_threshold =
      Config::get_env_int("VCONV_FAILURE_THRESHOLD", s.failure_threshold);

  const std::string policy =
      to_lower(Config::get_env_string("VCONV_MTIME_POLICY", "source"));
  if (policy == "source") {
    s.mtime_policy = MtimePolicy::Source;
  } else if (policy == "now") {
    s.mtime_policy = MtimePolicy::Now;
  } else {
    throw std::invalid_argument("VCONV_MTIME_POLICY must be 'source' or "
                                "'now': '" + policy + "'");
  }

  EncoderSettings &e = s.encoder;
  e.ffmpeg_path = Config::get_env_string("VCONV_FFMPEG", e.ffmpeg_path);
  e.codec = Config::get_env_string("VCONV_CODEC", e.codec);
  e.crf = Config::get_env_int("VCONV_CRF", e.crf);
  e.preset = Config::get_env_string("VCONV_PRESET", e.preset);
  e.audio_codec = Config::get_env_string("VCONV_AUDIO_CODEC", e.audio_codec);
  e.audio_bitrate =
      Config::get_env_string("VCONV_AUDIO_BITRATE", e.audio_bitrate);
  e.timeout_sec = Config::get_env_int("VCONV_ENCODE_TIMEOUT", e.timeout_sec);
  e.verify_output = Config::get_env_bool("VCONV_VERIFY_OUTPUT", true);

  RemoteSettings &r = s.remote;
  r.host = Config::get_env_string("VCONV_REMOTE_HOST", "");
  r.enabled = !r.host.empty();
  r.port = Config::get_env_int("VCONV_REMOTE_PORT", r.port);
  r.user = Config::get_env_string("VCONV_REMOTE_USER", "");
  r.key_path = Config::get_env_string("VCONV_REMOTE_KEY", "");
  const std::string known_hosts =
      Config::get_env_string("VCONV_KNOWN_HOSTS", "");
  if (to_lower(known_hosts) == "off") {
    r.verify_host_key = false;
  } else {
    r.known_hosts_path = known_hosts;
  }
  r.connect_timeout_sec =
      Config::get_env_int("VCONV_CONNECT_TIMEOUT", r.connect_timeout_sec);
  r.transfer_timeout_sec =
      Config::get_env_int("VCONV_TRANSFER_TIMEOUT", r.transfer_timeout_sec);
  r.allowed_roots = Config::get_env_list("VCONV_REMOTE_ROOTS", ':', s.roots);
  const int max_mb = Config::get_env_int("VCONV_MAX_TRANSFER_MB", 0);
  r.max_transfer_bytes =
      max_mb > 0 ? static_cast<std::uint64_t>(max_mb) * 1024 * 1024 : 0;

  return s;
}

// **---- Validation ----**

std::vector<std::string> validate_settings(Settings &s) {
  std::vector<std::string> errors;

  /// Normalize extensions: lowercase, no leading dot
  auto normalize_ext = [](std::string ext) {
    ext = to_lower(trim(ext));
    while (!ext.empty() && ext.front() == '.')
      ext.erase(ext.begin());
    return ext;
  };
  for (auto &ext : s.include_extensions)
    ext = normalize_ext(ext);
  s.include_extensions.erase(
      std::remove(s.include_extensions.begin(), s.include_extensions.end(),
                  std::string()),
      s.include_extensions.end());
  s.output_extension = normalize_ext(s.output_extension);

  if (s.roots.empty())
    errors.push_back("no directory roots configured (VCONV_ROOTS)");
  for (const auto &root : s.roots) {
    if (root.empty() || root.front() != '/')
      errors.push_back(fmt::format("root must be an absolute path: '{}'", root));
  }

  if (s.include_extensions.empty())
    errors.push_back("include extension set is empty");
  if (s.output_extension.empty())
    errors.push_back("output extension is empty");
  if (contains(s.include_extensions, s.output_extension))
    errors.push_back(fmt::format(
        "output extension '{}' is also an input extension; converted files "
        "would be reprocessed forever",
        s.output_extension));

  if (s.max_jobs < 1 || s.max_jobs > MAX_JOBS_LIMIT)
    errors.push_back(fmt::format("max jobs must be in [1, {}], got {}",
                                 MAX_JOBS_LIMIT, s.max_jobs));
  if (s.scan_interval_sec < MIN_SCAN_INTERVAL_SEC) {
    LOG_WARN("Scan interval {}s below floor, using {}s", s.scan_interval_sec,
             MIN_SCAN_INTERVAL_SEC);
    s.scan_interval_sec = MIN_SCAN_INTERVAL_SEC;
  }
  if (s.min_file_age_sec < 0)
    errors.push_back("minimum file age must not be negative");
  if (s.shutdown_grace_sec < 0)
    errors.push_back("shutdown grace period must not be negative");
  if (s.failure_threshold < 1)
    errors.push_back("failure threshold must be at least 1");
  if (s.work_dir.empty())
    errors.push_back("work directory is empty");
  if (s.state_dir.empty())
    errors.push_back("state directory is empty");

  const EncoderSettings &e = s.encoder;
  if (e.ffmpeg_path.empty())
    errors.push_back("encoder path is empty");
  if (!is_allowed_codec(e.codec))
    errors.push_back(fmt::format("codec not allowed: '{}'", e.codec));
  if (e.crf < 0 || e.crf > 51)
    errors.push_back(fmt::format("crf must be in [0, 51], got {}", e.crf));
  if (!is_allowed_preset(e.preset))
    errors.push_back(fmt::format("preset not allowed: '{}'", e.preset));
  if (!is_allowed_audio_codec(e.audio_codec))
    errors.push_back(
        fmt::format("audio codec not allowed: '{}'", e.audio_codec));
  if (!is_valid_audio_bitrate(e.audio_bitrate))
    errors.push_back(
        fmt::format("audio bitrate must look like '128k': '{}'",
                    e.audio_bitrate));
  if (e.timeout_sec <= 0)
    errors.push_back("encode timeout must be positive");

  const RemoteSettings &r = s.remote;
  if (r.enabled) {
    if (r.user.empty())
      errors.push_back("remote mode requires VCONV_REMOTE_USER");
    if (r.key_path.empty())
      errors.push_back("remote mode requires VCONV_REMOTE_KEY");
    if (r.port <= 0 || r.port > 65535)
      errors.push_back(fmt::format("invalid remote port {}", r.port));
    if (r.connect_timeout_sec <= 0 || r.transfer_timeout_sec <= 0)
      errors.push_back("remote timeouts must be positive");
    if (r.allowed_roots.empty())
      errors.push_back("remote mode requires at least one remote root");
    for (const auto &root : r.allowed_roots) {
      if (root.empty() || root.front() != '/')
        errors.push_back(
            fmt::format("remote root must be absolute: '{}'", root));
    }
    for (const auto &root : s.roots) {
      if (!path_within_roots(root, r.allowed_roots))
        errors.push_back(fmt::format(
            "scan root '{}' is outside the allowed remote roots", root));
    }
  }

  return errors;
}

} // namespace vconv

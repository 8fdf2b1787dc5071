/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Settings are read once at startup from environment variables
 *          (see config/vconv.env for documentation of each parameter) into
 *          a plain Settings struct, then validated. Everything downstream of
 *          main() receives an already-validated Settings by reference.
 *
 */

#ifndef VCONV_CONFIG_HPP
#define VCONV_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace vconv {

// **---- LIMITS ----**

/// Scan cycles never run more often than this
constexpr int MIN_SCAN_INTERVAL_SEC = 10;

/// Upper bound for concurrently running jobs
constexpr int MAX_JOBS_LIMIT = 16;

namespace Config {

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 * @throws std::invalid_argument if the value is not an integer
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  try {
    size_t used = 0;
    int parsed = std::stoi(val, &used);
    if (val[used] == '\0')
      return parsed;
  } catch (const std::exception &) {
  }
  throw std::invalid_argument(std::string(name) + " is not an integer: '" +
                              val + "'");
}

/**
 * @brief Get a boolean (1/0, true/false, yes/no, on/off) from environment.
 * @throws std::invalid_argument on any other value
 */
bool get_env_bool(const char *name, bool default_val);

/**
 * @brief Split an environment variable on a separator, trimming blanks.
 * @return Default list if the variable is unset or empty
 */
std::vector<std::string> get_env_list(const char *name, char separator,
                                      const std::vector<std::string> &def);

} // namespace Config

// **---- SETTINGS ----**

/// How the output's modification time is set after upload
enum class MtimePolicy : std::uint8_t {
  Source, //< Copy the source file's mtime
  Now     //< Leave the transfer time
};

/**
 * @struct EncoderSettings
 * @brief Allow-listed encoder parameters.
 * @note There is no field for extra encoder arguments.
 */
struct EncoderSettings {
  std::string ffmpeg_path = "ffmpeg";
  std::string codec = "libx264";
  int crf = 23;
  std::string preset = "medium";
  std::string audio_codec = "aac";
  std::string audio_bitrate = "128k";
  int timeout_sec = 4 * 3600;
  bool verify_output = true; //< Probe the output container with libavformat
};

/**
 * @struct RemoteSettings
 * @brief SFTP connection parameters (remote mode only).
 */
struct RemoteSettings {
  bool enabled = false;
  std::string host;
  int port = 22;
  std::string user;
  std::string key_path;
  std::string known_hosts_path; //< Empty = ~/.ssh/known_hosts
  bool verify_host_key = true;
  int connect_timeout_sec = 30;
  int transfer_timeout_sec = 3600;
  std::vector<std::string> allowed_roots; //< Containment roots for all I/O
  std::uint64_t max_transfer_bytes = 0;   //< 0 = unlimited
};

struct Settings {
  std::vector<std::string> roots; //< Scanned roots (remote paths if remote)
  std::vector<std::string> include_extensions; //< Lowercase, no dot
  std::vector<std::string> exclude_patterns;   //< fnmatch globs
  std::string output_extension = "m4v";
  int max_jobs = 2;
  int scan_interval_sec = 300;
  int min_file_age_sec = 30;
  std::string work_dir = "/var/lib/vconv/work";
  std::string state_dir = "/var/lib/vconv";
  bool keep_original = true;
  bool dry_run = false;
  int shutdown_grace_sec = 30;
  int failure_threshold = 3;
  MtimePolicy mtime_policy = MtimePolicy::Source;
  EncoderSettings encoder;
  RemoteSettings remote;
};

/**
 * @brief Build Settings from VCONV_* environment variables.
 * @throws std::invalid_argument on malformed numeric or boolean values
 * @note max_jobs = 0 resolves to the cgroup-aware CPU limit.
 */
Settings load_settings_from_env();

/**
 * @brief Validate and normalize settings in place.
 *
 * @details Lowercases extensions and strips leading dots, clamps the scan
 *          interval up to MIN_SCAN_INTERVAL_SEC, checks the encoder
 *          allow-lists and the remote mode requirements.
 *
 * @return List of ConfigError messages (empty = valid)
 */
std::vector<std::string> validate_settings(Settings &settings);

/// Allow-list checks, exposed for tests and check-config
bool is_allowed_codec(const std::string &codec);
bool is_allowed_audio_codec(const std::string &codec);
bool is_allowed_preset(const std::string &preset);
bool is_valid_audio_bitrate(const std::string &bitrate);

} // namespace vconv

#endif // VCONV_CONFIG_HPP

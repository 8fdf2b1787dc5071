// Settings loading and validation tests (run via CTest).
#include "test_support.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "vconv/config.hpp"

using namespace vconv;
using namespace vconv_test;

namespace {

const char *const ALL_VARS[] = {
    "VCONV_ROOTS",          "VCONV_EXTENSIONS",      "VCONV_EXCLUDE",
    "VCONV_OUTPUT_EXTENSION", "VCONV_MAX_JOBS",      "VCONV_SCAN_INTERVAL",
    "VCONV_MIN_FILE_AGE",   "VCONV_KEEP_ORIGINAL",   "VCONV_DRY_RUN",
    "VCONV_CODEC",          "VCONV_CRF",             "VCONV_PRESET",
    "VCONV_AUDIO_CODEC",    "VCONV_AUDIO_BITRATE",   "VCONV_REMOTE_HOST",
    "VCONV_REMOTE_USER",    "VCONV_REMOTE_KEY",      "VCONV_REMOTE_ROOTS",
    "VCONV_KNOWN_HOSTS",    "VCONV_MAX_TRANSFER_MB", "VCONV_MTIME_POLICY"};

void clear_env() {
  for (const char *name : ALL_VARS)
    ::unsetenv(name);
}

bool has_error(const std::vector<std::string> &errors,
               const std::string &needle) {
  for (const auto &e : errors) {
    if (e.find(needle) != std::string::npos)
      return true;
  }
  return false;
}

void test_defaults(TestContext &t) {
  clear_env();
  ::setenv("VCONV_ROOTS", "/videos:/more", 1);
  Settings s = load_settings_from_env();
  t.check(s.roots.size() == 2, "colon-separated roots parsed");
  t.check(s.output_extension == "m4v", "default output extension is m4v");
  t.check(s.keep_original, "originals are kept by default");
  t.check(!s.dry_run, "dry-run is off by default");
  t.check(s.encoder.codec == "libx264" && s.encoder.crf == 23,
          "default encoder settings");
  t.check(!s.remote.enabled, "remote mode off without a host");
  t.check(s.mtime_policy == MtimePolicy::Source, "mtime copied by default");

  const auto errors = validate_settings(s);
  t.check(errors.empty(), "default settings with roots are valid");
}

void test_lists_and_normalization(TestContext &t) {
  clear_env();
  ::setenv("VCONV_ROOTS", "/videos", 1);
  ::setenv("VCONV_EXTENSIONS", " .MP4, mkv ,, ", 1);
  ::setenv("VCONV_OUTPUT_EXTENSION", ".M4V", 1);
  Settings s = load_settings_from_env();
  const auto errors = validate_settings(s);
  t.check(errors.empty(), "normalized settings are valid");
  t.check(s.include_extensions == std::vector<std::string>({"mp4", "mkv"}),
          "extensions trimmed, lowercased and stripped of dots");
  t.check(s.output_extension == "m4v", "output extension normalized");
}

void test_malformed_numbers_throw(TestContext &t) {
  clear_env();
  ::setenv("VCONV_CRF", "23abc", 1);
  bool threw = false;
  try {
    load_settings_from_env();
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  t.check(threw, "non-integer value is rejected at load");

  clear_env();
  ::setenv("VCONV_DRY_RUN", "maybe", 1);
  threw = false;
  try {
    load_settings_from_env();
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  t.check(threw, "non-boolean value is rejected at load");
}

void test_allow_lists(TestContext &t) {
  t.check(is_allowed_codec("libx265"), "libx265 allowed");
  t.check(!is_allowed_codec("h264_nvenc"), "unlisted codec refused");
  t.check(is_allowed_audio_codec("libopus"), "libopus allowed");
  t.check(is_allowed_preset("veryslow"), "veryslow allowed");
  t.check(!is_allowed_preset("-vf"), "option-like preset refused");
  t.check(is_valid_audio_bitrate("128k"), "128k is a bitrate");
  t.check(!is_valid_audio_bitrate("128"), "bitrate needs a k suffix");
  t.check(!is_valid_audio_bitrate("12345k"), "bitrate at most 4 digits");
}

void test_validation_errors(TestContext &t) {
  Settings s;
  s.roots = {"relative/path"};
  s.include_extensions = {"mp4", "m4v"};
  s.output_extension = "m4v";
  s.max_jobs = 40;
  s.encoder.codec = "evil; rm -rf /";
  s.encoder.crf = 99;
  s.encoder.audio_bitrate = "loud";
  const auto errors = validate_settings(s);

  t.check(has_error(errors, "absolute"), "relative root reported");
  t.check(has_error(errors, "also an input extension"),
          "output extension among inputs reported");
  t.check(has_error(errors, "max jobs"), "max jobs range reported");
  t.check(has_error(errors, "codec not allowed"), "bad codec reported");
  t.check(has_error(errors, "crf"), "crf range reported");
  t.check(has_error(errors, "audio bitrate"), "bad bitrate reported");

  Settings none;
  t.check(has_error(validate_settings(none), "no directory roots"),
          "missing roots reported");
}

void test_scan_interval_floor(TestContext &t) {
  Settings s;
  s.roots = {"/videos"};
  s.include_extensions = {"mp4"};
  s.scan_interval_sec = 1;
  const auto errors = validate_settings(s);
  t.check(errors.empty(), "short interval is clamped, not rejected");
  t.check(s.scan_interval_sec == MIN_SCAN_INTERVAL_SEC,
          "interval raised to the floor");
}

void test_remote_requirements(TestContext &t) {
  clear_env();
  ::setenv("VCONV_ROOTS", "/srv/media/tv", 1);
  ::setenv("VCONV_REMOTE_HOST", "nas.local", 1);
  Settings s = load_settings_from_env();
  t.check(s.remote.enabled, "host enables remote mode");
  auto errors = validate_settings(s);
  t.check(has_error(errors, "VCONV_REMOTE_USER"), "missing user reported");
  t.check(has_error(errors, "VCONV_REMOTE_KEY"), "missing key reported");

  ::setenv("VCONV_REMOTE_USER", "media", 1);
  ::setenv("VCONV_REMOTE_KEY", "/etc/vconv/id_ed25519", 1);
  ::setenv("VCONV_REMOTE_ROOTS", "/srv/media", 1);
  ::setenv("VCONV_KNOWN_HOSTS", "off", 1);
  ::setenv("VCONV_MAX_TRANSFER_MB", "100", 1);
  s = load_settings_from_env();
  errors = validate_settings(s);
  t.check(errors.empty(), "complete remote settings are valid");
  t.check(!s.remote.verify_host_key, "known hosts check can be disabled");
  t.check(s.remote.max_transfer_bytes == 100ULL * 1024 * 1024,
          "transfer limit converted to bytes");

  ::setenv("VCONV_REMOTE_ROOTS", "/srv/other", 1);
  s = load_settings_from_env();
  errors = validate_settings(s);
  t.check(has_error(errors, "outside the allowed remote roots"),
          "scan root outside remote roots reported");
  clear_env();
}

} // namespace

int main() {
  TestContext t;
  test_defaults(t);
  test_lists_and_normalization(t);
  test_malformed_numbers_throw(t);
  test_allow_lists(t);
  test_validation_errors(t);
  test_scan_interval_floor(t);
  test_remote_requirements(t);
  return t.finish("vconv_config_tests");
}

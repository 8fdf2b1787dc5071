/**
 * @file converter.hpp
 * @brief External encoder invocation for one staged file
 *
 * @details The encoder is run as an explicit argument vector (fork/execvp,
 *          never a shell), built only from the input path, the output path
 *          and the allow-listed EncoderSettings:
 *
 *          ffmpeg -hide_banner -nostdin -loglevel error -i <in>
 *                 -c:v <codec> [-crf <crf> -preset <preset>]
 *                 -c:a <audio_codec> [-b:a <audio_bitrate>] -y <out>
 *
 *          The bracketed pairs are omitted for the "copy" codecs.
 *
 * @note A non-zero exit, a missing or empty output, a failed probe and an
 *       exceeded timeout are all reported as EncodeStatus::Failed or
 *       EncodeStatus::TimedOut, which the scheduler classifies as
 *       ConversionError.
 */

#ifndef VCONV_CONVERTER_HPP
#define VCONV_CONVERTER_HPP

#include <functional>
#include <string>
#include <vector>

#include "config.hpp"
#include "media_probe.hpp"

namespace vconv {

enum class EncodeStatus {
  Ok,
  Failed,   //< Non-zero exit, no output, or unusable output
  TimedOut, //< Killed after EncoderSettings::timeout_sec
  Cancelled //< Killed because the abort predicate fired
};

const char *to_string(EncodeStatus status);

/**
 * @brief Build the encoder argument vector (argv[0] is the encoder path).
 */
std::vector<std::string> build_encoder_args(const EncoderSettings &settings,
                                            const std::string &input_path,
                                            const std::string &output_path);

/**
 * @brief Run the encoder and wait for it.
 *
 * @param settings Encoder settings (validated)
 * @param input_path Local staged input
 * @param output_path Local output in the work directory
 * @param log_path File receiving the encoder's stderr (appended)
 * @param should_abort Polled while waiting; true kills the encoder
 * @param err Output: description of the failure
 */
EncodeStatus run_encoder(const EncoderSettings &settings,
                         const std::string &input_path,
                         const std::string &output_path,
                         const std::string &log_path,
                         const std::function<bool()> &should_abort,
                         std::string &err);

/**
 * @brief Run the encoder, then check and (optionally) probe its output.
 * @param info Output: probe result when verification is enabled
 */
EncodeStatus convert_file(const EncoderSettings &settings,
                          const std::string &input_path,
                          const std::string &output_path,
                          const std::string &log_path,
                          const std::function<bool()> &should_abort,
                          MediaInfo &info, std::string &err);

} // namespace vconv

#endif // VCONV_CONVERTER_HPP

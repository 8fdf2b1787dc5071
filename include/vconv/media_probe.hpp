/**
 * @file media_probe.hpp
 * @brief Output container verification with libavformat
 */

#ifndef VCONV_MEDIA_PROBE_HPP
#define VCONV_MEDIA_PROBE_HPP

#include <string>

namespace vconv {

/**
 * @struct MediaInfo
 * @brief What the probe learned about a container.
 */
struct MediaInfo {
  unsigned int streams = 0;
  double duration_sec = 0.0; //< 0 if the container does not say
  std::string video_codec;   //< Empty if there is no video stream
  std::string format_name;
};

/**
 * @brief Open a file with libavformat and read its stream info.
 * @return false with err set if the file does not open, has no streams, or
 *         its stream info cannot be read
 */
bool probe_media(const std::string &path, MediaInfo &info, std::string &err);

} // namespace vconv

#endif // VCONV_MEDIA_PROBE_HPP

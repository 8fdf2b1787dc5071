/**
 * @file media_probe.cpp
 * @brief libavformat probe of encoder output
 */

#include "vconv/media_probe.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

namespace vconv {

namespace {

std::string av_error_string(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return buf;
}

} // anonymous namespace

bool probe_media(const std::string &path, MediaInfo &info, std::string &err) {
  AVFormatContext *fmt_ctx = nullptr;
  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    err = fmt::format("avformat_open_input {}: {}", path, av_error_string(ret));
    return false;
  }

  /// Reads a few packets to fill in codec parameters
  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    err = fmt::format("avformat_find_stream_info {}: {}", path,
                      av_error_string(ret));
    avformat_close_input(&fmt_ctx);
    return false;
  }

  info = MediaInfo();
  info.streams = fmt_ctx->nb_streams;
  if (fmt_ctx->iformat && fmt_ctx->iformat->name)
    info.format_name = fmt_ctx->iformat->name;
  if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0)
    info.duration_sec = static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;

  const int video_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx >= 0) {
    info.video_codec =
        avcodec_get_name(fmt_ctx->streams[video_idx]->codecpar->codec_id);
  }
  avformat_close_input(&fmt_ctx);

  if (info.streams == 0) {
    err = fmt::format("{} contains no streams", path);
    return false;
  }
  return true;
}

} // namespace vconv

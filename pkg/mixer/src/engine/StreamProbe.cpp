// Repository: RTMix
// Component: Stream Probe
// Purpose: Read basic audio stream properties (libavformat) for debug diagnostics.
// Copyright (c) 2025 RetroVue

#include "rtmix/engine/StreamProbe.hpp"

#include <sstream>

#ifdef RTMIX_FFMPEG_AVAILABLE
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
}
#endif

namespace rtmix::engine {

std::string StreamInfo::ToString() const {
  std::ostringstream oss;
  oss << "codec=" << (codec_name.empty() ? "?" : codec_name)
      << " channels=" << channels
      << " sample_rate=" << sample_rate
      << " duration=" << duration_seconds << "s";
  return oss.str();
}

#ifdef RTMIX_FFMPEG_AVAILABLE

namespace {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

bool StreamProbe::Available() { return true; }

std::optional<StreamInfo> StreamProbe::Probe(const std::string& path, std::string* error) {
  AVFormatContext* format_ctx = nullptr;
  int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    if (error != nullptr) *error = "open_input failed: " + AvError(ret);
    return std::nullopt;
  }

  ret = avformat_find_stream_info(format_ctx, nullptr);
  if (ret < 0) {
    if (error != nullptr) *error = "find_stream_info failed: " + AvError(ret);
    avformat_close_input(&format_ctx);
    return std::nullopt;
  }

  const int index = av_find_best_stream(format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (index < 0) {
    if (error != nullptr) *error = "no audio stream";
    avformat_close_input(&format_ctx);
    return std::nullopt;
  }

  const AVStream* stream = format_ctx->streams[index];
  const AVCodecParameters* par = stream->codecpar;

  StreamInfo info;
  info.channels = par->ch_layout.nb_channels;
  info.sample_rate = par->sample_rate;
  info.codec_name = avcodec_get_name(par->codec_id);
  if (format_ctx->duration != AV_NOPTS_VALUE) {
    info.duration_seconds = static_cast<double>(format_ctx->duration) / AV_TIME_BASE;
  } else if (stream->duration != AV_NOPTS_VALUE) {
    info.duration_seconds = static_cast<double>(stream->duration) * av_q2d(stream->time_base);
  }

  avformat_close_input(&format_ctx);
  return info;
}

#else

bool StreamProbe::Available() { return false; }

std::optional<StreamInfo> StreamProbe::Probe(const std::string& path, std::string* error) {
  (void)path;
  if (error != nullptr) *error = "built without FFmpeg libraries";
  return std::nullopt;
}

#endif  // RTMIX_FFMPEG_AVAILABLE

}  // namespace rtmix::engine

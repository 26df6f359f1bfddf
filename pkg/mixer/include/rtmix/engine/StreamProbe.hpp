// Repository: RTMix
// Component: Stream Probe
// Purpose: Read basic audio stream properties (libavformat) for debug diagnostics.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_ENGINE_STREAM_PROBE_HPP_
#define RTMIX_ENGINE_STREAM_PROBE_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace rtmix::engine {

struct StreamInfo {
  int32_t channels = 0;
  int32_t sample_rate = 0;
  double duration_seconds = 0.0;  // container duration; 0 when unknown
  std::string codec_name;

  std::string ToString() const;
};

// StreamProbe opens a file with libavformat and reports its best audio
// stream. It is an observability aid: callers log the result and never gate
// pipeline success on it.
//
// Built without FFmpeg (RTMIX_FFMPEG_AVAILABLE undefined), Probe() always
// returns empty and Available() is false.
class StreamProbe {
 public:
  static bool Available();

  // Returns empty optional and fills *error on failure.
  static std::optional<StreamInfo> Probe(const std::string& path, std::string* error);
};

}  // namespace rtmix::engine

#endif  // RTMIX_ENGINE_STREAM_PROBE_HPP_

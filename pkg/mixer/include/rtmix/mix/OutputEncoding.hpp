// Repository: RTMix
// Component: Output Encoding
// Purpose: Common sample rate / channel layout / codec for every stage output.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_MIX_OUTPUT_ENCODING_HPP_
#define RTMIX_MIX_OUTPUT_ENCODING_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace rtmix::mix {

// OutputEncoding is the program format every stage normalizes to and the
// engine encodes with. Fixed for the lifetime of a MixerConfig.
struct OutputEncoding {
  int32_t sample_rate = 48000;     // Hz
  int32_t channels = 2;
  std::string codec = "libmp3lame";
  int32_t bitrate_kbps = 192;
  std::string extension = "mp3";   // file extension of stage artifacts

  // Parse from a JSON object, e.g.
  //   {"sample_rate":48000,"channels":2,"codec":"libmp3lame",
  //    "bitrate_kbps":192,"extension":"mp3"}
  // Missing fields keep their defaults. Returns empty optional on a
  // malformed field or when the result fails IsValid().
  static std::optional<OutputEncoding> FromJson(const std::string& json_str);

  std::string ToJson() const;

  bool IsValid() const;

  // Engine channel layout name: "mono", "stereo", otherwise "<n>c".
  std::string ChannelLayoutName() const;
};

}  // namespace rtmix::mix

#endif  // RTMIX_MIX_OUTPUT_ENCODING_HPP_

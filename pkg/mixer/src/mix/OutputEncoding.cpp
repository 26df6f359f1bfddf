// Repository: RTMix
// Component: Output Encoding
// Purpose: Parse and validate the stage output encoding from JSON.
// Copyright (c) 2025 RetroVue

#include "rtmix/mix/OutputEncoding.hpp"

#include <sstream>

#include "rtmix/util/JsonFields.hpp"

namespace rtmix::mix {

namespace {

// Missing → keep default; present but malformed → failure.
bool ReadInt(const std::string& json, const char* field, int32_t& out) {
  if (!util::HasJsonField(json, field)) return true;
  int64_t value = 0;
  if (!util::ExtractJsonInt(json, field, value)) return false;
  if (value < INT32_MIN || value > INT32_MAX) return false;
  out = static_cast<int32_t>(value);
  return true;
}

bool ReadString(const std::string& json, const char* field, std::string& out) {
  if (!util::HasJsonField(json, field)) return true;
  return util::ExtractJsonString(json, field, out);
}

bool IsSafeToken(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!ok) return false;
  }
  return true;
}

}  // namespace

std::optional<OutputEncoding> OutputEncoding::FromJson(const std::string& json_str) {
  if (json_str.empty()) {
    return std::nullopt;
  }

  OutputEncoding encoding;
  if (!ReadInt(json_str, "sample_rate", encoding.sample_rate)) return std::nullopt;
  if (!ReadInt(json_str, "channels", encoding.channels)) return std::nullopt;
  if (!ReadString(json_str, "codec", encoding.codec)) return std::nullopt;
  if (!ReadInt(json_str, "bitrate_kbps", encoding.bitrate_kbps)) return std::nullopt;
  if (!ReadString(json_str, "extension", encoding.extension)) return std::nullopt;

  if (!encoding.IsValid()) {
    return std::nullopt;
  }
  return encoding;
}

std::string OutputEncoding::ToJson() const {
  std::ostringstream oss;
  oss << "{"
      << "\"sample_rate\":" << sample_rate << ","
      << "\"channels\":" << channels << ","
      << "\"codec\":\"" << util::JsonEscape(codec) << "\","
      << "\"bitrate_kbps\":" << bitrate_kbps << ","
      << "\"extension\":\"" << util::JsonEscape(extension) << "\""
      << "}";
  return oss.str();
}

bool OutputEncoding::IsValid() const {
  if (sample_rate < 8000 || sample_rate > 192000) {
    return false;
  }
  if (channels < 1 || channels > 8) {
    return false;
  }
  if (bitrate_kbps <= 0) {
    return false;
  }
  // Both end up on the engine command line and in file names.
  if (!IsSafeToken(codec) || !IsSafeToken(extension)) {
    return false;
  }
  return true;
}

std::string OutputEncoding::ChannelLayoutName() const {
  if (channels == 1) return "mono";
  if (channels == 2) return "stereo";
  return std::to_string(channels) + "c";
}

}  // namespace rtmix::mix

// Repository: RTMix
// Component: Mixer Configuration
// Purpose: Process-wide settings built once at startup and passed by reference.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_MIX_MIXER_CONFIG_HPP_
#define RTMIX_MIX_MIXER_CONFIG_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "rtmix/mix/OutputEncoding.hpp"

namespace rtmix::mix {

// MixerConfig carries everything the pipeline needs from its environment.
// Nothing below the process entry point reads environment variables or
// globals; the orchestrator receives this struct by reference.
struct MixerConfig {
  static constexpr int64_t kDefaultStageTimeoutMs = 300'000;
  static constexpr int64_t kDefaultMinAssetBytes = 500;

  std::string engine_path = "ffmpeg";      // resolved against PATH when bare
  std::string engine_log_level = "info";   // ffmpeg -v level
  std::string work_root = "/tmp";          // parent of per-run scratch dirs
  bool retain_artifacts = false;           // keep intermediates for inspection
  bool debug_probe = false;                // probe inputs and stage-1 output, log them
  int64_t stage_timeout_ms = kDefaultStageTimeoutMs;  // 0 = unlimited
  int64_t min_asset_bytes = kDefaultMinAssetBytes;
  std::string listen_address = "127.0.0.1:50071";
  // rtmixd only: client-named asset paths and output_path must resolve
  // beneath this directory. Empty means work_root.
  std::string client_path_root;
  OutputEncoding encoding;

  const std::string& ClientPathRoot() const {
    return client_path_root.empty() ? work_root : client_path_root;
  }

  // Parse from JSON. Missing fields keep defaults; "encoding" is a nested
  // OutputEncoding object. Returns empty optional on a malformed field or
  // when the result fails IsValid().
  static std::optional<MixerConfig> FromJson(const std::string& json_str);

  // Read and parse a config file. Returns empty optional when the file is
  // unreadable or invalid.
  static std::optional<MixerConfig> FromFile(const std::string& path);

  // Apply process environment overrides:
  //   RTMIX_DEBUG=1      → retain_artifacts, debug_probe
  //   RTMIX_FFMPEG=PATH  → engine_path
  //   RTMIX_WORK_ROOT=D  → work_root
  void ApplyEnvironment();

  std::string ToJson() const;

  bool IsValid() const;
};

}  // namespace rtmix::mix

#endif  // RTMIX_MIX_MIXER_CONFIG_HPP_

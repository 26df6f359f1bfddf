// Repository: RTMix
// Component: Mixer Configuration
// Purpose: Parse, validate and environment-override the mixer settings.
// Copyright (c) 2025 RetroVue

#include "rtmix/mix/MixerConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include "rtmix/util/JsonFields.hpp"
#include "rtmix/util/Logger.hpp"

namespace rtmix::mix {

namespace {

bool ReadString(const std::string& json, const char* field, std::string& out) {
  if (!util::HasJsonField(json, field)) return true;
  return util::ExtractJsonString(json, field, out);
}

bool ReadInt(const std::string& json, const char* field, int64_t& out) {
  if (!util::HasJsonField(json, field)) return true;
  return util::ExtractJsonInt(json, field, out);
}

bool ReadBool(const std::string& json, const char* field, bool& out) {
  if (!util::HasJsonField(json, field)) return true;
  return util::ExtractJsonBool(json, field, out);
}

bool IsKnownLogLevel(const std::string& level) {
  static const char* kLevels[] = {"quiet", "panic", "fatal", "error", "warning",
                                  "info", "verbose", "debug", "trace"};
  for (const char* known : kLevels) {
    if (level == known) return true;
  }
  return false;
}

}  // namespace

std::optional<MixerConfig> MixerConfig::FromJson(const std::string& json_str) {
  if (json_str.empty()) {
    return std::nullopt;
  }

  MixerConfig config;

  // Pull the nested encoding object out first so its keys never collide
  // with top-level lookups.
  std::string top_level = json_str;
  if (util::HasJsonField(json_str, "encoding")) {
    std::string encoding_json;
    if (!util::ExtractJsonObject(json_str, "encoding", encoding_json)) {
      return std::nullopt;
    }
    auto encoding = OutputEncoding::FromJson(encoding_json);
    if (!encoding) {
      return std::nullopt;
    }
    config.encoding = *encoding;
    const size_t at = top_level.find(encoding_json);
    if (at != std::string::npos) {
      top_level.replace(at, encoding_json.size(), "{}");
    }
  }

  if (!ReadString(top_level, "engine_path", config.engine_path)) return std::nullopt;
  if (!ReadString(top_level, "engine_log_level", config.engine_log_level)) return std::nullopt;
  if (!ReadString(top_level, "work_root", config.work_root)) return std::nullopt;
  if (!ReadBool(top_level, "retain_artifacts", config.retain_artifacts)) return std::nullopt;
  if (!ReadBool(top_level, "debug_probe", config.debug_probe)) return std::nullopt;
  if (!ReadInt(top_level, "stage_timeout_ms", config.stage_timeout_ms)) return std::nullopt;
  if (!ReadInt(top_level, "min_asset_bytes", config.min_asset_bytes)) return std::nullopt;
  if (!ReadString(top_level, "listen_address", config.listen_address)) return std::nullopt;
  if (!ReadString(top_level, "client_path_root", config.client_path_root)) return std::nullopt;

  if (!config.IsValid()) {
    return std::nullopt;
  }
  return config;
}

std::optional<MixerConfig> MixerConfig::FromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return FromJson(buffer.str());
}

void MixerConfig::ApplyEnvironment() {
  if (util::EnvFlagIsOne("RTMIX_DEBUG")) {
    retain_artifacts = true;
    debug_probe = true;
  }
  const char* engine = std::getenv("RTMIX_FFMPEG");
  if (engine != nullptr && *engine != '\0') {
    engine_path = engine;
  }
  const char* work = std::getenv("RTMIX_WORK_ROOT");
  if (work != nullptr && *work != '\0') {
    work_root = work;
  }
}

std::string MixerConfig::ToJson() const {
  std::ostringstream oss;
  oss << "{"
      << "\"engine_path\":\"" << util::JsonEscape(engine_path) << "\","
      << "\"engine_log_level\":\"" << util::JsonEscape(engine_log_level) << "\","
      << "\"work_root\":\"" << util::JsonEscape(work_root) << "\","
      << "\"retain_artifacts\":" << (retain_artifacts ? "true" : "false") << ","
      << "\"debug_probe\":" << (debug_probe ? "true" : "false") << ","
      << "\"stage_timeout_ms\":" << stage_timeout_ms << ","
      << "\"min_asset_bytes\":" << min_asset_bytes << ","
      << "\"listen_address\":\"" << util::JsonEscape(listen_address) << "\","
      << "\"client_path_root\":\"" << util::JsonEscape(client_path_root) << "\","
      << "\"encoding\":" << encoding.ToJson()
      << "}";
  return oss.str();
}

bool MixerConfig::IsValid() const {
  if (engine_path.empty() || work_root.empty()) {
    return false;
  }
  if (!IsKnownLogLevel(engine_log_level)) {
    return false;
  }
  if (stage_timeout_ms < 0 || min_asset_bytes < 0) {
    return false;
  }
  return encoding.IsValid();
}

}  // namespace rtmix::mix

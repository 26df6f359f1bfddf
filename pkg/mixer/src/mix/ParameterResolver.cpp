// Repository: RTMix
// Component: Parameter Resolver
// Purpose: Permissive knob coercion; malformed values degrade to defaults.
// Copyright (c) 2025 RetroVue

#include "rtmix/mix/ParameterResolver.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

#include "rtmix/util/Logger.hpp"

namespace rtmix::mix {

namespace {

bool Positive(double v) { return v > 0.0; }
bool NonNegative(double v) { return v >= 0.0; }
bool AtLeastOne(double v) { return v >= 1.0; }
bool Negative(double v) { return v < 0.0; }
bool NonPositive(double v) { return v <= 0.0; }
bool AnyValue(double) { return true; }

struct NumericKnob {
  const char* key;
  double MixRequest::*member;
  double fallback;
  bool (*valid)(double);
};

struct FlagKnob {
  const char* key;
  bool MixRequest::*member;
};

const NumericKnob kNumericKnobs[] = {
    {"bed_volume", &MixRequest::bed_volume, defaults::kBedVolume, Positive},
    {"voice_gain", &MixRequest::voice_gain, defaults::kVoiceGain, Positive},
    {"bed_weight", &MixRequest::bed_weight, defaults::kBedWeight, Positive},
    {"voice_weight", &MixRequest::voice_weight, defaults::kVoiceWeight, Positive},
    {"narration_delay", &MixRequest::narration_delay_seconds,
     defaults::kNarrationDelaySeconds, NonNegative},
    {"duck_threshold", &MixRequest::duck_threshold, defaults::kDuckThreshold, Positive},
    {"duck_ratio", &MixRequest::duck_ratio, defaults::kDuckRatio, AtLeastOne},
    {"crossfade", &MixRequest::crossfade_seconds, defaults::kCrossfadeSeconds,
     NonNegative},
    {"outro_gain", &MixRequest::outro_gain, defaults::kOutroGain, Positive},
    {"lufs", &MixRequest::target_loudness_lufs, defaults::kTargetLoudnessLufs,
     Negative},
    {"true_peak", &MixRequest::true_peak_ceiling_db, defaults::kTruePeakCeilingDb,
     NonPositive},
    {"lra", &MixRequest::loudness_range_lu, defaults::kLoudnessRangeLu, Positive},
    {"song_start", &MixRequest::song_start_seconds, defaults::kSongStartSeconds,
     NonNegative},
    {"song_gain_db", &MixRequest::song_gain_db, defaults::kSongGainDb, AnyValue},
    {"song_fade", &MixRequest::song_fade_seconds, defaults::kSongFadeSeconds,
     NonNegative},
    {"program_fade", &MixRequest::program_fade_seconds, defaults::kProgramFadeSeconds,
     NonNegative},
};

const FlagKnob kFlagKnobs[] = {
    {"voice_only", &MixRequest::voice_only},
    {"step1_only", &MixRequest::step1_only},
};

std::string Trim(const std::string& s) {
  const char* ws = " \t\r\n";
  const size_t begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) return "";
  const size_t end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

const ParameterResolver::KnobInfo* FindKnob(const std::string& key) {
  for (const auto& knob : ParameterResolver::Knobs()) {
    if (knob.key == key) return &knob;
  }
  return nullptr;
}

}  // namespace

const std::vector<ParameterResolver::KnobInfo>& ParameterResolver::Knobs() {
  // Aliases are the legacy CLI and HTTP form spellings.
  static const std::vector<KnobInfo> kKnobs = {
      {"bed_volume", {"bg_vol", "bedVolume"}, false},
      {"voice_gain", {"voiceGain"}, false},
      {"bed_weight", {"bedWeight"}, false},
      {"voice_weight", {"voiceWeight"}, false},
      {"narration_delay", {"narration_delay_seconds", "narrationDelaySeconds"}, false},
      {"duck_threshold", {"duckThreshold"}, false},
      {"duck_ratio", {"duckRatio"}, false},
      {"crossfade", {"xfade", "crossfade_seconds", "crossfadeSeconds"}, false},
      {"outro_gain", {"outroGain"}, false},
      {"lufs", {"target_lufs", "targetLoudnessLUFS"}, false},
      {"true_peak", {"tp", "truePeakCeilingDb"}, false},
      {"lra", {"loudness_range", "loudnessRangeLU"}, false},
      {"song_start", {"song_start_seconds", "songStart"}, false},
      {"song_gain_db", {"songGainDb"}, false},
      {"song_fade", {"song_fade_seconds", "songFade"}, false},
      {"program_fade", {"program_fade_seconds", "programFade"}, false},
      {"voice_only", {"voiceOnly", "voiceOnlyMode"}, true},
      {"step1_only", {"step1Only", "step1OnlyMode"}, true},
  };
  return kKnobs;
}

std::optional<double> ParameterResolver::ParseNumber(const std::string& text) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) return std::nullopt;

  // Decimal only: strtod would also take hex floats ("0x10").
  const size_t digits = (trimmed[0] == '+' || trimmed[0] == '-') ? 1 : 0;
  if (trimmed.size() > digits + 1 && trimmed[digits] == '0' &&
      (trimmed[digits + 1] == 'x' || trimmed[digits + 1] == 'X')) {
    return std::nullopt;
  }

  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(trimmed.c_str(), &end);
  if (end == trimmed.c_str() || *end != '\0' || errno == ERANGE) {
    return std::nullopt;
  }
  if (!std::isfinite(value)) return std::nullopt;
  return value;
}

bool ParameterResolver::ParseFlag(const std::string& text) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) return false;

  errno = 0;
  char* end = nullptr;
  const long value = std::strtol(trimmed.c_str(), &end, 10);
  if (end == trimmed.c_str() || *end != '\0' || errno == ERANGE) {
    return false;
  }
  return value == 1;
}

std::optional<std::string> ParameterResolver::Lookup(const KnobSource& source,
                                                     const KnobInfo& knob) {
  auto present = [&source](const std::string& key) -> std::optional<std::string> {
    auto it = source.find(key);
    if (it == source.end() || Trim(it->second).empty()) return std::nullopt;
    return it->second;
  };

  if (auto v = present(knob.key)) return v;
  for (const auto& alias : knob.aliases) {
    if (auto v = present(alias)) return v;
  }
  return std::nullopt;
}

MixRequest ParameterResolver::Resolve(const KnobSource& primary,
                                      const KnobSource& secondary) {
  MixRequest request;

  for (const auto& field : kNumericKnobs) {
    const KnobInfo* knob = FindKnob(field.key);
    if (knob == nullptr) continue;

    std::optional<std::string> raw = Lookup(primary, *knob);
    if (!raw) raw = Lookup(secondary, *knob);
    if (!raw) {
      request.*field.member = field.fallback;
      continue;
    }

    std::optional<double> parsed = ParseNumber(*raw);
    if (parsed && field.valid(*parsed)) {
      request.*field.member = *parsed;
    } else {
      request.*field.member = field.fallback;
      std::ostringstream oss;
      oss << "[ParameterResolver] knob " << field.key << "='" << *raw
          << "' rejected, using default " << field.fallback;
      util::Logger::Debug(oss.str());
    }
  }

  for (const auto& field : kFlagKnobs) {
    const KnobInfo* knob = FindKnob(field.key);
    if (knob == nullptr) continue;

    std::optional<std::string> raw = Lookup(primary, *knob);
    if (!raw) raw = Lookup(secondary, *knob);
    request.*field.member = raw ? ParseFlag(*raw) : false;
  }

  return request;
}

}  // namespace rtmix::mix

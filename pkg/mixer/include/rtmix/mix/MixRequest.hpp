// Repository: RTMix
// Component: Mix Request
// Purpose: Canonical, fully-typed knob set consumed by the mixing pipeline.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_MIX_MIX_REQUEST_HPP_
#define RTMIX_MIX_MIX_REQUEST_HPP_

#include <string>

namespace rtmix::mix {

// Compiled-in knob defaults. These are what a malformed or missing knob
// resolves to (see ParameterResolver).
namespace defaults {
constexpr double kBedVolume = 0.25;
constexpr double kVoiceGain = 1.5;
constexpr double kBedWeight = 0.35;
constexpr double kVoiceWeight = 1.0;
constexpr double kNarrationDelaySeconds = 0.0;
constexpr double kDuckThreshold = 0.02;
constexpr double kDuckRatio = 12.0;
constexpr double kCrossfadeSeconds = 1.0;
constexpr double kOutroGain = 1.0;
constexpr double kTargetLoudnessLufs = -16.0;
constexpr double kTruePeakCeilingDb = -1.5;
constexpr double kLoudnessRangeLu = 11.0;
constexpr double kSongStartSeconds = 0.0;
constexpr double kSongGainDb = -3.0;
constexpr double kSongFadeSeconds = 0.6;
constexpr double kProgramFadeSeconds = 0.0;
}  // namespace defaults

// Fixed signal-chain constants. Not exposed as knobs.
constexpr int kVoiceHighpassHz = 120;
constexpr int kDuckAttackMs = 5;
constexpr int kDuckReleaseMs = 300;
constexpr const char* kCrossfadeCurve = "tri";

// Bed mute while a song clip plays: a hard sidechain compressor keyed on the
// clip. Threshold is -50 dBFS as a linear amplitude.
constexpr double kSongMuteThreshold = 0.0031622777;
constexpr int kSongMuteRatio = 20;
constexpr int kSongMuteAttackMs = 5;
constexpr int kSongMuteReleaseMs = 200;

// MixRequest is the resolved parameter set for one pipeline run.
// Gains are linear multipliers; loudness targets are in LUFS / dBTP / LU.
//
// voice_only takes precedence over step1_only when both are set.
struct MixRequest {
  double bed_volume = defaults::kBedVolume;
  double voice_gain = defaults::kVoiceGain;
  double bed_weight = defaults::kBedWeight;
  double voice_weight = defaults::kVoiceWeight;
  double narration_delay_seconds = defaults::kNarrationDelaySeconds;
  double duck_threshold = defaults::kDuckThreshold;
  double duck_ratio = defaults::kDuckRatio;
  double crossfade_seconds = defaults::kCrossfadeSeconds;
  double outro_gain = defaults::kOutroGain;
  double target_loudness_lufs = defaults::kTargetLoudnessLufs;
  double true_peak_ceiling_db = defaults::kTruePeakCeilingDb;
  double loudness_range_lu = defaults::kLoudnessRangeLu;
  // Song clip placement; only used when the run supplies a clip.
  double song_start_seconds = defaults::kSongStartSeconds;
  double song_gain_db = defaults::kSongGainDb;
  double song_fade_seconds = defaults::kSongFadeSeconds;
  // Fade-in at the head of the stage-1 program; 0 = none.
  double program_fade_seconds = defaults::kProgramFadeSeconds;
  bool voice_only = false;
  bool step1_only = false;

  // True when the run ends after stage 1 (either diagnostic mode).
  bool EndsAfterStage1() const { return voice_only || step1_only; }

  // True when every field satisfies its invariant.
  bool IsValid() const;

  // One-line key=value rendering for logs.
  std::string ToString() const;
};

}  // namespace rtmix::mix

#endif  // RTMIX_MIX_MIX_REQUEST_HPP_

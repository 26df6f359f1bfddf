// Repository: RTMix
// Component: Mix Request
// Purpose: Invariant checks and log rendering for the resolved knob set.
// Copyright (c) 2025 RetroVue

#include "rtmix/mix/MixRequest.hpp"

#include <cmath>
#include <sstream>

namespace rtmix::mix {

bool MixRequest::IsValid() const {
  const double positives[] = {bed_volume, voice_gain, bed_weight, voice_weight,
                              duck_threshold, outro_gain, loudness_range_lu};
  for (double v : positives) {
    if (!std::isfinite(v) || v <= 0.0) return false;
  }
  if (!std::isfinite(narration_delay_seconds) || narration_delay_seconds < 0.0) {
    return false;
  }
  if (!std::isfinite(crossfade_seconds) || crossfade_seconds < 0.0) return false;
  if (!std::isfinite(duck_ratio) || duck_ratio < 1.0) return false;
  if (!std::isfinite(target_loudness_lufs) || target_loudness_lufs >= 0.0) {
    return false;
  }
  if (!std::isfinite(true_peak_ceiling_db) || true_peak_ceiling_db > 0.0) {
    return false;
  }
  if (!std::isfinite(song_start_seconds) || song_start_seconds < 0.0) return false;
  if (!std::isfinite(song_fade_seconds) || song_fade_seconds < 0.0) return false;
  if (!std::isfinite(song_gain_db)) return false;
  if (!std::isfinite(program_fade_seconds) || program_fade_seconds < 0.0) return false;
  return true;
}

std::string MixRequest::ToString() const {
  std::ostringstream oss;
  oss << "bed_volume=" << bed_volume
      << " voice_gain=" << voice_gain
      << " bed_weight=" << bed_weight
      << " voice_weight=" << voice_weight
      << " narration_delay=" << narration_delay_seconds
      << " duck_threshold=" << duck_threshold
      << " duck_ratio=" << duck_ratio
      << " crossfade=" << crossfade_seconds
      << " outro_gain=" << outro_gain
      << " lufs=" << target_loudness_lufs
      << " tp=" << true_peak_ceiling_db
      << " lra=" << loudness_range_lu
      << " song_start=" << song_start_seconds
      << " song_gain_db=" << song_gain_db
      << " song_fade=" << song_fade_seconds
      << " program_fade=" << program_fade_seconds
      << " voice_only=" << (voice_only ? 1 : 0)
      << " step1_only=" << (step1_only ? 1 : 0);
  return oss.str();
}

}  // namespace rtmix::mix

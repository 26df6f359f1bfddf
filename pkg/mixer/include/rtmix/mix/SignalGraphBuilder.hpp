// Repository: RTMix
// Component: Signal Graph Builder
// Purpose: Build the three per-stage signal graphs from a resolved MixRequest.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_MIX_SIGNAL_GRAPH_BUILDER_HPP_
#define RTMIX_MIX_SIGNAL_GRAPH_BUILDER_HPP_

#include <string>

#include "rtmix/mix/MixRequest.hpp"
#include "rtmix/mix/OutputEncoding.hpp"
#include "rtmix/mix/SignalGraph.hpp"

namespace rtmix::mix {

// Named stage inputs. The orchestrator binds these to files.
namespace inputs {
constexpr const char* kBed = "bed";          // stage 1: intro bed
constexpr const char* kVoice = "voice";      // stage 1: narration
constexpr const char* kSong = "song";        // stage 1: optional song clip
constexpr const char* kCore = "core";        // stage 2: stage-1 artifact
constexpr const char* kOutro = "outro";      // stage 2: outro bed
constexpr const char* kProgram = "program";  // stage 3: stage-2 artifact
}  // namespace inputs

// SignalGraphBuilder is pure: no I/O, no engine knowledge beyond filter
// names. Identical requests and encodings yield identical graphs.
//
// Stage 1 (bed+voice mix):
//   bed   → format → volume(bed_volume)                          → bed_pre
//   voice → format → highpass(120) → volume(voice_gain) → adelay → voice_pre
//   voice_pre → asplit → voice_key, voice_mix
//   sidechaincompress(bed_pre, key=voice_key)                     → bed_ducked
//   amix(bed_ducked, voice_mix, duration=shortest, weights)       → mix
// In voice_only mode the bed is never declared; the voice chain ends at mix.
// With program_fade > 0 the last node writes mix_pre and afade(in) → mix.
//
// Stage 1 with a song clip (normal mode only):
//   song → format → afade(in) → volume(song_gain_db dB) → adelay(song_start)
//   song_pre → asplit → song_key, song_mix
//   sidechaincompress(bed_ducked, key=song_key, ratio 20)         → bed_gated
//   amix(bed_gated, voice_mix, duration=shortest, weights)        → bed_voice
//   amix(bed_voice, song_mix, duration=first)                     → mix
//
// Stage 2 (crossfade to outro):
//   core → format; outro → format → volume(outro_gain)
//   acrossfade(tri/tri, crossfade_seconds) → joined
//   (concat below kMinCrossfadeSeconds)
//
// Stage 3 (loudness normalize):
//   program → loudnorm(I, TP, LRA) → aresample → final
class SignalGraphBuilder {
 public:
  // Shortest crossfade rendered as acrossfade; ffmpeg durations have
  // microsecond resolution and d=0 means "default length".
  static constexpr double kMinCrossfadeSeconds = 0.000001;

  explicit SignalGraphBuilder(OutputEncoding encoding);

  // with_song_clip declares the song input; ignored in voice_only mode.
  SignalGraph BuildBedVoiceMix(const MixRequest& request,
                               bool with_song_clip = false) const;
  SignalGraph BuildCrossfadeOutro(const MixRequest& request) const;
  SignalGraph BuildLoudnessNormalize(const MixRequest& request) const;

  const OutputEncoding& encoding() const { return encoding_; }

 private:
  // Appends aformat + aresample for `input`; returns the normalized label.
  std::string Normalize(SignalGraph& graph, const std::string& input) const;

  // Appends the narration chain ending at `out_label`.
  void BuildVoiceChain(SignalGraph& graph, const MixRequest& request,
                       const std::string& out_label) const;

  // Appends the song clip chain ending at `out_label`.
  void BuildSongChain(SignalGraph& graph, const MixRequest& request,
                      const std::string& out_label) const;

  OutputEncoding encoding_;
};

}  // namespace rtmix::mix

#endif  // RTMIX_MIX_SIGNAL_GRAPH_BUILDER_HPP_

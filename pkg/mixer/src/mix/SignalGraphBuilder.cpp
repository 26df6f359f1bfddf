// Repository: RTMix
// Component: Signal Graph Builder
// Purpose: Build the three per-stage signal graphs from a resolved MixRequest.
// Copyright (c) 2025 RetroVue

#include "rtmix/mix/SignalGraphBuilder.hpp"

#include <cmath>
#include <cstdint>
#include <utility>

namespace rtmix::mix {

namespace {

// adelay takes one delay per channel, in milliseconds, '|'-separated.
std::string PerChannelDelay(int64_t delay_ms, int32_t channels) {
  std::string value;
  for (int32_t ch = 0; ch < channels; ++ch) {
    if (ch > 0) value += "|";
    value += std::to_string(delay_ms);
  }
  return value;
}

}  // namespace

SignalGraphBuilder::SignalGraphBuilder(OutputEncoding encoding)
    : encoding_(std::move(encoding)) {}

std::string SignalGraphBuilder::Normalize(SignalGraph& graph,
                                          const std::string& input) const {
  const std::string formatted = input + "_fmt";
  const std::string resampled = input + "_rs";
  graph.AddNode("aformat", {input}, {formatted})
      .Param("channel_layouts", encoding_.ChannelLayoutName());
  graph.AddNode("aresample", {formatted}, {resampled})
      .Param("out_sample_rate", encoding_.sample_rate);
  return resampled;
}

void SignalGraphBuilder::BuildVoiceChain(SignalGraph& graph,
                                         const MixRequest& request,
                                         const std::string& out_label) const {
  const std::string normalized = Normalize(graph, inputs::kVoice);

  graph.AddNode("highpass", {normalized}, {"voice_hp"})
      .Param("f", kVoiceHighpassHz);

  const int64_t delay_ms =
      static_cast<int64_t>(std::llround(request.narration_delay_seconds * 1000.0));
  if (delay_ms <= 0) {
    graph.AddNode("volume", {"voice_hp"}, {out_label})
        .Param("volume", request.voice_gain);
    return;
  }

  graph.AddNode("volume", {"voice_hp"}, {"voice_gained"})
      .Param("volume", request.voice_gain);
  graph.AddNode("adelay", {"voice_gained"}, {out_label})
      .Param("delays", PerChannelDelay(delay_ms, encoding_.channels));
}

void SignalGraphBuilder::BuildSongChain(SignalGraph& graph,
                                        const MixRequest& request,
                                        const std::string& out_label) const {
  std::string label = Normalize(graph, inputs::kSong);

  if (request.song_fade_seconds > 0.0) {
    graph.AddNode("afade", {label}, {"song_faded"})
        .Param("t", "in")
        .Param("d", request.song_fade_seconds);
    label = "song_faded";
  }

  const int64_t delay_ms =
      static_cast<int64_t>(std::llround(request.song_start_seconds * 1000.0));
  const std::string gained = delay_ms > 0 ? "song_gained" : out_label;
  graph.AddNode("volume", {label}, {gained})
      .Param("volume", FormatNumber(request.song_gain_db) + "dB");
  if (delay_ms > 0) {
    graph.AddNode("adelay", {gained}, {out_label})
        .Param("delays", PerChannelDelay(delay_ms, encoding_.channels));
  }
}

SignalGraph SignalGraphBuilder::BuildBedVoiceMix(const MixRequest& request,
                                                 bool with_song_clip) const {
  SignalGraph graph;
  const bool fade_in = request.program_fade_seconds > 0.0;
  const std::string mixed = fade_in ? "mix_pre" : "mix";
  auto finish = [&]() {
    if (fade_in) {
      graph.AddNode("afade", {mixed}, {"mix"})
          .Param("t", "in")
          .Param("d", request.program_fade_seconds);
    }
    graph.SetOutput("mix");
  };

  if (request.voice_only) {
    // Narration chain in isolation; the bed is not an input at all.
    graph.AddInput(inputs::kVoice);
    BuildVoiceChain(graph, request, mixed);
    finish();
    return graph;
  }

  graph.AddInput(inputs::kBed);
  graph.AddInput(inputs::kVoice);
  if (with_song_clip) graph.AddInput(inputs::kSong);

  const std::string bed_in = Normalize(graph, inputs::kBed);
  graph.AddNode("volume", {bed_in}, {"bed_pre"})
      .Param("volume", request.bed_volume);

  BuildVoiceChain(graph, request, "voice_pre");

  // The narration feeds both the compressor key and the mix.
  graph.AddNode("asplit", {"voice_pre"}, {"voice_key", "voice_mix"})
      .Param("outputs", 2);

  graph.AddNode("sidechaincompress", {"bed_pre", "voice_key"}, {"bed_ducked"})
      .Param("threshold", request.duck_threshold)
      .Param("ratio", request.duck_ratio)
      .Param("attack", kDuckAttackMs)
      .Param("release", kDuckReleaseMs);

  std::string bed = "bed_ducked";
  if (with_song_clip) {
    BuildSongChain(graph, request, "song_pre");
    graph.AddNode("asplit", {"song_pre"}, {"song_key", "song_mix"})
        .Param("outputs", 2);
    // Bed is held down to near silence while the clip is audible.
    graph.AddNode("sidechaincompress", {"bed_ducked", "song_key"}, {"bed_gated"})
        .Param("threshold", kSongMuteThreshold)
        .Param("ratio", kSongMuteRatio)
        .Param("attack", kSongMuteAttackMs)
        .Param("release", kSongMuteReleaseMs);
    bed = "bed_gated";
  }

  // Program length follows the narration: any bed tail past it is dropped.
  const std::string voiced = with_song_clip ? "bed_voice" : mixed;
  graph.AddNode("amix", {bed, "voice_mix"}, {voiced})
      .Param("inputs", 2)
      .Param("duration", "shortest")
      .Param("dropout_transition", 0)
      .Param("weights", FormatNumber(request.bed_weight) + " " +
                            FormatNumber(request.voice_weight));

  if (with_song_clip) {
    graph.AddNode("amix", {"bed_voice", "song_mix"}, {mixed})
        .Param("inputs", 2)
        .Param("duration", "first")
        .Param("dropout_transition", 0);
  }

  finish();
  return graph;
}

SignalGraph SignalGraphBuilder::BuildCrossfadeOutro(const MixRequest& request) const {
  SignalGraph graph;
  graph.AddInput(inputs::kCore);
  graph.AddInput(inputs::kOutro);

  const std::string core = Normalize(graph, inputs::kCore);
  const std::string outro = Normalize(graph, inputs::kOutro);
  graph.AddNode("volume", {outro}, {"outro_pre"})
      .Param("volume", request.outro_gain);

  if (request.crossfade_seconds >= kMinCrossfadeSeconds) {
    graph.AddNode("acrossfade", {core, "outro_pre"}, {"joined"})
        .Param("d", request.crossfade_seconds)
        .Param("c1", kCrossfadeCurve)
        .Param("c2", kCrossfadeCurve);
  } else {
    // acrossfade treats d=0 as "use the default length", so a zero-length
    // transition is a plain splice.
    graph.AddNode("concat", {core, "outro_pre"}, {"joined"})
        .Param("n", 2)
        .Param("v", 0)
        .Param("a", 1);
  }

  graph.SetOutput("joined");
  return graph;
}

SignalGraph SignalGraphBuilder::BuildLoudnessNormalize(const MixRequest& request) const {
  SignalGraph graph;
  graph.AddInput(inputs::kProgram);

  graph.AddNode("loudnorm", {inputs::kProgram}, {"normalized"})
      .Param("I", request.target_loudness_lufs)
      .Param("TP", request.true_peak_ceiling_db)
      .Param("LRA", request.loudness_range_lu)
      .Param("print_format", "summary");
  // loudnorm upsamples internally; bring it back to the program rate.
  graph.AddNode("aresample", {"normalized"}, {"final"})
      .Param("out_sample_rate", encoding_.sample_rate);

  graph.SetOutput("final");
  return graph;
}

}  // namespace rtmix::mix

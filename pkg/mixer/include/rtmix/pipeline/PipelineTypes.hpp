// Repository: RTMix
// Component: Pipeline Types
// Purpose: Assets, artifacts, run states and result structs shared by the pipeline.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_PIPELINE_PIPELINE_TYPES_HPP_
#define RTMIX_PIPELINE_PIPELINE_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rtmix::pipeline {

enum class AssetRole {
  kIntroBed = 0,
  kNarration = 1,
  kOutroBed = 2,
  kSongClip = 3,
};

const char* ToString(AssetRole role);

// AudioAsset is an immutable reference to one input file. `valid` is
// computed once, against the minimum plausible size, when the asset is
// built.
struct AudioAsset {
  AssetRole role = AssetRole::kNarration;
  std::string path;
  int64_t bytes = 0;
  bool exists = false;  // regular file that could be stat'ed
  bool valid = false;   // exists && bytes >= min_bytes

  // stat() the path. Never fails; a missing file yields exists=false.
  static AudioAsset FromPath(AssetRole role, const std::string& path, int64_t min_bytes);
};

// Where the inputs of a run live. intro_bed is unused in voice-only mode and
// outro_bed is unused when the run ends after stage 1. song_clip is optional;
// when set it is laid over the stage-1 mix and mutes the bed while it plays.
struct MixAssets {
  std::string intro_bed_path;
  std::string narration_path;
  std::string outro_bed_path;
  std::string song_clip_path;

  bool has_song_clip() const { return !song_clip_path.empty(); }
};

struct StageArtifact {
  int stage = 0;
  std::string path;
  int64_t bytes = 0;
  bool is_final = false;
};

enum class PipelineError {
  kNone = 0,
  kInvalidInput = 1,
  kEngineFailure = 2,
  kConfigurationError = 3,
};

const char* ToString(PipelineError error);

enum class PipelineState {
  kResolving = 0,
  kStage1 = 1,
  kStage2 = 2,
  kStage3 = 3,
  kDone = 4,
  kDoneEarly = 5,
  kFailed = 6,
};

const char* ToString(PipelineState state);

// Legal edges:
//   kResolving → kStage1 | kFailed
//   kStage1    → kStage2 | kDoneEarly | kFailed
//   kStage2    → kStage3 | kFailed
//   kStage3    → kDone | kFailed
bool IsLegalTransition(PipelineState from, PipelineState to);

bool IsTerminal(PipelineState state);

enum class TerminalKind {
  kNone = 0,
  kSucceeded = 1,
  kSucceededVoiceOnly = 2,
  kSucceededStep1Only = 3,
  kFailed = 4,
};

const char* ToString(TerminalKind kind);

struct StateTransition {
  PipelineState from;
  PipelineState to;
  std::string note;
};

struct RunOptions {
  // Final artifact destination. Empty → rtmix_final_<run_id>.<ext> in the
  // run's work area.
  std::string output_path;
  // Overrides MixerConfig::retain_artifacts for this run.
  std::optional<bool> retain_artifacts;
};

// PipelineResult is what Run() returns. On failure no final artifact exists
// and output_path is empty; failed_stage is 0 when the failure happened
// before any stage ran.
struct PipelineResult {
  bool ok = false;
  PipelineError error = PipelineError::kNone;
  int failed_stage = 0;
  std::string detail;
  std::string output_path;
  PipelineState state = PipelineState::kResolving;
  TerminalKind terminal = TerminalKind::kNone;
  std::string run_id;
  std::string work_dir;
  std::vector<StageArtifact> artifacts;     // every artifact the run produced
  std::vector<StateTransition> transitions;

  bool early_exit() const { return state == PipelineState::kDoneEarly; }

  static PipelineResult Success(std::string output_path, TerminalKind kind) {
    PipelineResult r;
    r.ok = true;
    r.output_path = std::move(output_path);
    r.terminal = kind;
    r.state = kind == TerminalKind::kSucceeded ? PipelineState::kDone
                                               : PipelineState::kDoneEarly;
    return r;
  }

  static PipelineResult Failure(PipelineError error, int stage, std::string detail) {
    PipelineResult r;
    r.ok = false;
    r.error = error;
    r.failed_stage = stage;
    r.detail = std::move(detail);
    r.state = PipelineState::kFailed;
    r.terminal = TerminalKind::kFailed;
    return r;
  }
};

}  // namespace rtmix::pipeline

#endif  // RTMIX_PIPELINE_PIPELINE_TYPES_HPP_

// Repository: RTMix
// Component: Pipeline Orchestrator
// Purpose: Drive one mixing run through resolve, three engine stages and cleanup.
// Copyright (c) 2025 RetroVue

#include "rtmix/pipeline/PipelineOrchestrator.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rtmix/engine/FilterGraphSerializer.hpp"
#include "rtmix/pipeline/WorkArea.hpp"
#include "rtmix/util/Logger.hpp"

namespace rtmix::pipeline {

namespace {

std::string ParentDirectory(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  if (slash == std::string::npos) return ".";
  if (slash == 0) return "/";
  return path.substr(0, slash);
}

// Per-run bookkeeping. Lives on Run()'s stack.
class RunTracker {
 public:
  explicit RunTracker(std::string run_id) : run_id_(std::move(run_id)) {}

  const std::string& run_id() const { return run_id_; }
  PipelineState state() const { return state_; }
  const std::vector<StateTransition>& transitions() const { return transitions_; }

  std::string Tag() const { return "[PipelineOrchestrator] run=" + run_id_; }

  void Transition(PipelineState to, const std::string& note) {
    if (!IsLegalTransition(state_, to)) {
      util::Logger::Error(Tag() + " illegal transition " + ToString(state_) + " -> " +
                          ToString(to));
      return;
    }
    transitions_.push_back({state_, to, note});
    util::Logger::Info(Tag() + " " + ToString(state_) + " -> " + ToString(to) +
                       (note.empty() ? "" : " (" + note + ")"));
    state_ = to;
  }

 private:
  std::string run_id_;
  PipelineState state_ = PipelineState::kResolving;
  std::vector<StateTransition> transitions_;
};

}  // namespace

PipelineOrchestrator::PipelineOrchestrator(const mix::MixerConfig& config,
                                           engine::IDspEngine& engine)
    : config_(config),
      engine_(engine),
      builder_(config.encoding),
      executor_(engine, config) {}

std::vector<mix::SignalGraph> PipelineOrchestrator::PlanGraphs(const mix::MixRequest& request,
                                                               bool with_song_clip) const {
  std::vector<mix::SignalGraph> graphs;
  graphs.push_back(builder_.BuildBedVoiceMix(request, with_song_clip));
  if (request.EndsAfterStage1()) return graphs;
  graphs.push_back(builder_.BuildCrossfadeOutro(request));
  graphs.push_back(builder_.BuildLoudnessNormalize(request));
  return graphs;
}

PipelineResult PipelineOrchestrator::Run(const MixAssets& assets,
                                         const mix::MixRequest& request,
                                         const RunOptions& options) const {
  RunTracker run(WorkArea::NewRunId());
  const bool retain = options.retain_artifacts.value_or(config_.retain_artifacts);
  const std::string& ext = config_.encoding.extension;

  std::optional<WorkArea> area;
  std::vector<std::string> stage_outputs;  // every path handed to the engine
  std::vector<StageArtifact> artifacts;

  util::Logger::Info(run.Tag() + " start " + request.ToString());

  // Terminal bookkeeping shared by every exit path.
  auto finish = [&](PipelineResult result) {
    const std::string& final_path = result.output_path;
    std::string error;
    if (!retain) {
      for (const auto& path : stage_outputs) {
        if (path == final_path) continue;
        if (!WorkArea::RemoveFile(path, &error)) {
          util::Logger::Warn(run.Tag() + " cleanup: " + error);
        }
      }
      const bool final_in_area =
          area && !final_path.empty() && ParentDirectory(final_path) == area->dir();
      if (area && !final_in_area && !area->RemoveAll(&error)) {
        util::Logger::Warn(run.Tag() + " cleanup: " + error);
      }
    }

    result.run_id = run.run_id();
    result.work_dir = area ? area->dir() : "";
    result.artifacts = artifacts;
    result.transitions = run.transitions();
    result.state = run.state();

    if (result.ok) {
      util::Logger::Info(run.Tag() + " " + ToString(result.terminal) + " output=" +
                         result.output_path);
    } else {
      util::Logger::Error(run.Tag() + " FAILED stage=" + std::to_string(result.failed_stage) +
                          " error=" + ToString(result.error) + ": " + result.detail);
    }
    return result;
  };

  auto fail = [&](PipelineError error, int stage, const std::string& detail) {
    run.Transition(PipelineState::kFailed, ToString(error));
    return finish(PipelineResult::Failure(error, stage, detail));
  };

  // ---------------------------------------------------------------------------
  // kResolving: configuration, then assets
  // ---------------------------------------------------------------------------
  if (!config_.IsValid()) {
    return fail(PipelineError::kConfigurationError, 0, "invalid mixer configuration");
  }
  std::string reason;
  if (!engine_.IsAvailable(&reason)) {
    return fail(PipelineError::kConfigurationError, 0, reason);
  }
  if (!WorkArea::IsUsableDirectory(config_.work_root)) {
    return fail(PipelineError::kConfigurationError, 0,
                "work root '" + config_.work_root + "' is not a writable directory");
  }
  if (!options.output_path.empty() &&
      !WorkArea::IsUsableDirectory(ParentDirectory(options.output_path))) {
    return fail(PipelineError::kConfigurationError, 0,
                "output directory for '" + options.output_path + "' is not writable");
  }
  if (!request.IsValid()) {
    return fail(PipelineError::kInvalidInput, 0,
                "mix parameters out of range: " + request.ToString());
  }

  const bool with_song = assets.has_song_clip() && !request.voice_only;

  std::vector<std::pair<AssetRole, std::string>> wanted;
  wanted.emplace_back(AssetRole::kNarration, assets.narration_path);
  if (!request.voice_only) wanted.emplace_back(AssetRole::kIntroBed, assets.intro_bed_path);
  if (with_song) wanted.emplace_back(AssetRole::kSongClip, assets.song_clip_path);
  if (!request.EndsAfterStage1()) {
    wanted.emplace_back(AssetRole::kOutroBed, assets.outro_bed_path);
  }
  for (const auto& [role, path] : wanted) {
    const AssetCheck check = executor_.VerifyAsset(role, path);
    if (!check.ok) return fail(PipelineError::kInvalidInput, 0, check.detail);
  }
  if (config_.debug_probe) {
    for (const auto& [role, path] : wanted) {
      executor_.ProbeAndLog(std::string("input ") + ToString(role), path);
    }
  }

  std::string area_error;
  area = WorkArea::Create(config_.work_root, "rtmix", run.run_id(), &area_error);
  if (!area) {
    return fail(PipelineError::kConfigurationError, 0, area_error);
  }

  const std::string final_path =
      options.output_path.empty() ? area->FinalPath(ext) : options.output_path;

  auto run_stage = [&](int stage, const mix::SignalGraph& graph,
                       const std::vector<engine::EngineInput>& inputs) {
    const std::string output = area->StagePath(stage, ext);
    stage_outputs.push_back(output);
    util::Logger::Info(run.Tag() + " stage=" + std::to_string(stage) +
                       " graph: " + engine::SerializeFilterComplex(graph));
    util::Logger::Debug(run.Tag() + " stage=" + std::to_string(stage) + " nodes:\n" +
                        graph.Describe());
    StageResult result = executor_.Execute(stage, graph, inputs, output);
    if (result.ok) artifacts.push_back(result.artifact);
    return result;
  };

  auto promote = [&](const StageArtifact& artifact, std::string* error) {
    if (!WorkArea::Promote(artifact.path, final_path, error)) return false;
    for (auto& a : artifacts) {
      if (a.path == artifact.path) {
        a.path = final_path;
        a.is_final = true;
      }
    }
    return true;
  };

  // ---------------------------------------------------------------------------
  // kStage1: bed + voice mix
  // ---------------------------------------------------------------------------
  run.Transition(PipelineState::kStage1,
                 request.voice_only ? "voice_only" : (with_song ? "song_clip" : ""));
  std::vector<engine::EngineInput> stage1_inputs;
  if (!request.voice_only) {
    stage1_inputs.push_back({mix::inputs::kBed, assets.intro_bed_path});
  }
  stage1_inputs.push_back({mix::inputs::kVoice, assets.narration_path});
  if (with_song) {
    stage1_inputs.push_back({mix::inputs::kSong, assets.song_clip_path});
  }

  const StageResult s1 =
      run_stage(1, builder_.BuildBedVoiceMix(request, with_song), stage1_inputs);
  if (!s1.ok) return fail(s1.error, 1, s1.detail);

  if (request.EndsAfterStage1()) {
    std::string error;
    if (!promote(s1.artifact, &error)) {
      return fail(PipelineError::kConfigurationError, 1, error);
    }
    const TerminalKind kind = request.voice_only ? TerminalKind::kSucceededVoiceOnly
                                                 : TerminalKind::kSucceededStep1Only;
    run.Transition(PipelineState::kDoneEarly, ToString(kind));
    return finish(PipelineResult::Success(final_path, kind));
  }

  // ---------------------------------------------------------------------------
  // kStage2: crossfade into outro
  // ---------------------------------------------------------------------------
  run.Transition(PipelineState::kStage2, "");
  const StageResult s2 = run_stage(
      2, builder_.BuildCrossfadeOutro(request),
      {{mix::inputs::kCore, s1.artifact.path}, {mix::inputs::kOutro, assets.outro_bed_path}});
  if (!s2.ok) return fail(s2.error, 2, s2.detail);

  // ---------------------------------------------------------------------------
  // kStage3: loudness normalization
  // ---------------------------------------------------------------------------
  run.Transition(PipelineState::kStage3, "");
  const StageResult s3 = run_stage(3, builder_.BuildLoudnessNormalize(request),
                                   {{mix::inputs::kProgram, s2.artifact.path}});
  if (!s3.ok) return fail(s3.error, 3, s3.detail);

  std::string error;
  if (!promote(s3.artifact, &error)) {
    return fail(PipelineError::kConfigurationError, 3, error);
  }
  run.Transition(PipelineState::kDone, "");
  return finish(PipelineResult::Success(final_path, TerminalKind::kSucceeded));
}

}  // namespace rtmix::pipeline

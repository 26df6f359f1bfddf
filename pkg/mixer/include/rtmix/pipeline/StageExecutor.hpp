// Repository: RTMix
// Component: Stage Executor
// Purpose: Verify stage inputs, submit one graph to the engine, verify its output.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_PIPELINE_STAGE_EXECUTOR_HPP_
#define RTMIX_PIPELINE_STAGE_EXECUTOR_HPP_

#include <string>
#include <utility>
#include <vector>

#include "rtmix/engine/IDspEngine.hpp"
#include "rtmix/mix/MixerConfig.hpp"
#include "rtmix/mix/SignalGraph.hpp"
#include "rtmix/pipeline/PipelineTypes.hpp"

namespace rtmix::pipeline {

struct AssetCheck {
  bool ok = false;
  AudioAsset asset;
  std::string detail;

  static AssetCheck Success(AudioAsset asset) {
    return {true, std::move(asset), ""};
  }

  static AssetCheck Failure(AudioAsset asset, std::string detail) {
    return {false, std::move(asset), std::move(detail)};
  }
};

struct StageResult {
  bool ok = false;
  PipelineError error = PipelineError::kNone;
  int stage = 0;
  std::string detail;  // engine diagnostic or synthesized reason
  StageArtifact artifact;

  static StageResult Success(StageArtifact artifact, std::string diagnostic) {
    StageResult r;
    r.ok = true;
    r.stage = artifact.stage;
    r.detail = std::move(diagnostic);
    r.artifact = std::move(artifact);
    return r;
  }

  static StageResult Failure(PipelineError error, int stage, std::string detail) {
    StageResult r;
    r.ok = false;
    r.error = error;
    r.stage = stage;
    r.detail = std::move(detail);
    return r;
  }
};

// StageExecutor runs exactly one stage: one graph, one engine submission,
// one output file. It holds references only and keeps no per-call state, so
// one instance may serve concurrent runs.
class StageExecutor {
 public:
  StageExecutor(engine::IDspEngine& engine, const mix::MixerConfig& config);

  // Asset must exist, be a regular file and be at least
  // config.min_asset_bytes long.
  AssetCheck VerifyAsset(AssetRole role, const std::string& path) const;

  // Inputs are bound to graph.inputs() in order. Each input must be a
  // regular file of at least config.min_asset_bytes, else kInvalidInput and
  // the engine is not called. On engine success the output must exist and be
  // non-empty; otherwise the stage fails with kEngineFailure.
  //
  // With config.debug_probe the stage-1 output is probed and logged. A probe
  // failure is logged as a warning and never fails the stage.
  StageResult Execute(int stage,
                      const mix::SignalGraph& graph,
                      const std::vector<engine::EngineInput>& inputs,
                      const std::string& output_path) const;

  // Probe `path` and log its stream parameters under `label`
  // ("[StageExecutor] <label> <path> ..."). Warn on failure. Diagnostic only.
  void ProbeAndLog(const std::string& label, const std::string& path) const;

  engine::IDspEngine& engine_;
  const mix::MixerConfig& config_;
};

}  // namespace rtmix::pipeline

#endif  // RTMIX_PIPELINE_STAGE_EXECUTOR_HPP_

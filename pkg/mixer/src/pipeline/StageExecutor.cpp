// Repository: RTMix
// Component: Stage Executor
// Purpose: Verify stage inputs, submit one graph to the engine, verify its output.
// Copyright (c) 2025 RetroVue

#include "rtmix/pipeline/StageExecutor.hpp"

#include <sstream>

#include "rtmix/engine/StreamProbe.hpp"
#include "rtmix/util/Logger.hpp"

namespace rtmix::pipeline {

namespace {

std::string EngineFailureDetail(int stage, const engine::EngineResult& result) {
  std::ostringstream oss;
  oss << "stage " << stage << " engine ";
  if (result.timed_out) {
    oss << "timed out";
  } else {
    oss << "failed (exit " << result.exit_code << ")";
  }
  if (!result.diagnostic.empty()) {
    oss << ": " << result.diagnostic;
  }
  return oss.str();
}

}  // namespace

StageExecutor::StageExecutor(engine::IDspEngine& engine, const mix::MixerConfig& config)
    : engine_(engine), config_(config) {}

AssetCheck StageExecutor::VerifyAsset(AssetRole role, const std::string& path) const {
  AudioAsset asset = AudioAsset::FromPath(role, path, config_.min_asset_bytes);
  if (path.empty()) {
    return AssetCheck::Failure(std::move(asset),
                               std::string(ToString(role)) + ": no file supplied");
  }
  if (!asset.exists) {
    return AssetCheck::Failure(std::move(asset),
                               std::string(ToString(role)) + ": '" + path +
                                   "' is missing or not a regular file");
  }
  if (!asset.valid) {
    std::ostringstream oss;
    oss << ToString(role) << ": '" << path << "' is " << asset.bytes
        << " bytes (minimum " << config_.min_asset_bytes << ")";
    return AssetCheck::Failure(std::move(asset), oss.str());
  }
  return AssetCheck::Success(std::move(asset));
}

StageResult StageExecutor::Execute(int stage,
                                   const mix::SignalGraph& graph,
                                   const std::vector<engine::EngineInput>& inputs,
                                   const std::string& output_path) const {
  for (const auto& input : inputs) {
    const AudioAsset a =
        AudioAsset::FromPath(AssetRole::kNarration, input.path, config_.min_asset_bytes);
    if (a.valid) continue;
    std::ostringstream oss;
    oss << "stage " << stage << " input '" << input.name << "' (" << input.path << ") ";
    if (!a.exists) {
      oss << "is missing or not a regular file";
    } else {
      oss << "is " << a.bytes << " bytes (minimum " << config_.min_asset_bytes << ")";
    }
    return StageResult::Failure(PipelineError::kInvalidInput, stage, oss.str());
  }

  engine::EngineJob job;
  job.stage = stage;
  job.inputs = inputs;
  job.graph = graph;
  job.encoding = config_.encoding;
  job.output_path = output_path;

  const engine::EngineResult result = engine_.Submit(job);
  if (!result.diagnostic.empty()) {
    util::Logger::Debug("[StageExecutor] stage=" + std::to_string(stage) +
                        " engine output:\n" + result.diagnostic);
  }
  if (!result.success) {
    return StageResult::Failure(PipelineError::kEngineFailure, stage,
                                EngineFailureDetail(stage, result));
  }

  const AudioAsset produced = AudioAsset::FromPath(AssetRole::kNarration, output_path, 1);
  if (!produced.valid) {
    return StageResult::Failure(
        PipelineError::kEngineFailure, stage,
        "stage " + std::to_string(stage) + " engine reported success but output '" +
            output_path + "' is missing or empty");
  }

  StageArtifact artifact;
  artifact.stage = stage;
  artifact.path = output_path;
  artifact.bytes = produced.bytes;

  if (stage == 1 && config_.debug_probe) {
    ProbeAndLog("stage=1 artifact", artifact.path);
  }
  return StageResult::Success(std::move(artifact), result.diagnostic);
}

void StageExecutor::ProbeAndLog(const std::string& label, const std::string& path) const {
  std::string error;
  const auto info = engine::StreamProbe::Probe(path, &error);
  if (!info) {
    util::Logger::Warn("[StageExecutor] " + label + " " + path + " unreadable: " + error);
    return;
  }
  util::Logger::Info("[StageExecutor] " + label + " " + path + " " + info->ToString());
}

}  // namespace rtmix::pipeline

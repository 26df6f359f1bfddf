// Repository: RTMix
// Component: Pipeline Types
// Purpose: Assets, artifacts, run states and result structs shared by the pipeline.
// Copyright (c) 2025 RetroVue

#include "rtmix/pipeline/PipelineTypes.hpp"

#include <map>
#include <set>

#include <sys/stat.h>

namespace rtmix::pipeline {

const char* ToString(AssetRole role) {
  switch (role) {
    case AssetRole::kIntroBed: return "intro_bed";
    case AssetRole::kNarration: return "narration";
    case AssetRole::kOutroBed: return "outro_bed";
    case AssetRole::kSongClip: return "song_clip";
  }
  return "unknown";
}

const char* ToString(PipelineError error) {
  switch (error) {
    case PipelineError::kNone: return "NONE";
    case PipelineError::kInvalidInput: return "INVALID_INPUT";
    case PipelineError::kEngineFailure: return "ENGINE_FAILURE";
    case PipelineError::kConfigurationError: return "CONFIGURATION_ERROR";
  }
  return "UNKNOWN";
}

const char* ToString(PipelineState state) {
  switch (state) {
    case PipelineState::kResolving: return "RESOLVING";
    case PipelineState::kStage1: return "STAGE1";
    case PipelineState::kStage2: return "STAGE2";
    case PipelineState::kStage3: return "STAGE3";
    case PipelineState::kDone: return "DONE";
    case PipelineState::kDoneEarly: return "DONE_EARLY";
    case PipelineState::kFailed: return "FAILED";
  }
  return "UNKNOWN";
}

const char* ToString(TerminalKind kind) {
  switch (kind) {
    case TerminalKind::kNone: return "NONE";
    case TerminalKind::kSucceeded: return "SUCCEEDED";
    case TerminalKind::kSucceededVoiceOnly: return "SUCCEEDED_EARLY(VOICE_ONLY)";
    case TerminalKind::kSucceededStep1Only: return "SUCCEEDED_EARLY(STEP1_ONLY)";
    case TerminalKind::kFailed: return "FAILED";
  }
  return "UNKNOWN";
}

bool IsLegalTransition(PipelineState from, PipelineState to) {
  static const std::map<PipelineState, std::set<PipelineState>> kTransitions = {
      {PipelineState::kResolving, {PipelineState::kStage1, PipelineState::kFailed}},
      {PipelineState::kStage1,
       {PipelineState::kStage2, PipelineState::kDoneEarly, PipelineState::kFailed}},
      {PipelineState::kStage2, {PipelineState::kStage3, PipelineState::kFailed}},
      {PipelineState::kStage3, {PipelineState::kDone, PipelineState::kFailed}},
  };
  auto it = kTransitions.find(from);
  if (it == kTransitions.end()) return false;
  return it->second.count(to) > 0;
}

bool IsTerminal(PipelineState state) {
  return state == PipelineState::kDone || state == PipelineState::kDoneEarly ||
         state == PipelineState::kFailed;
}

AudioAsset AudioAsset::FromPath(AssetRole role, const std::string& path, int64_t min_bytes) {
  AudioAsset asset;
  asset.role = role;
  asset.path = path;
  struct stat st;
  if (!path.empty() && stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
    asset.exists = true;
    asset.bytes = static_cast<int64_t>(st.st_size);
  }
  asset.valid = asset.exists && asset.bytes >= min_bytes;
  return asset;
}

}  // namespace rtmix::pipeline

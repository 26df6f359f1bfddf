// Repository: RTMix
// Component: Pipeline Orchestrator
// Purpose: Drive one mixing run through resolve, three engine stages and cleanup.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_PIPELINE_PIPELINE_ORCHESTRATOR_HPP_
#define RTMIX_PIPELINE_PIPELINE_ORCHESTRATOR_HPP_

#include <string>
#include <vector>

#include "rtmix/engine/IDspEngine.hpp"
#include "rtmix/mix/MixRequest.hpp"
#include "rtmix/mix/MixerConfig.hpp"
#include "rtmix/mix/SignalGraph.hpp"
#include "rtmix/mix/SignalGraphBuilder.hpp"
#include "rtmix/pipeline/PipelineTypes.hpp"
#include "rtmix/pipeline/StageExecutor.hpp"

namespace rtmix::pipeline {

// PipelineOrchestrator runs the state machine
//
//   kResolving → kStage1 → kStage2 → kStage3 → kDone
//                   │          │         │
//                   ├→ kDoneEarly        │
//                   └──────────┴─────────┴→ kFailed
//
// kResolving checks configuration (engine resolvable, work root writable,
// output destination writable) and then every asset the run will read. No
// stage runs unless both pass. With config.debug_probe each verified asset
// is also probed and logged.
//
// A song clip in MixAssets is ignored when the request is voice_only.
//
// Stage N reads only files written before it and writes one file into the
// run's work area. The last produced artifact is promoted (renamed) to the
// final path. At every terminal state non-final artifacts are deleted
// unless retain is in effect.
//
// Thread Safety:
// - Run() keeps all per-run state on its own stack; concurrent calls share
//   only the config and engine references.
class PipelineOrchestrator {
 public:
  // Both references must outlive the orchestrator.
  PipelineOrchestrator(const mix::MixerConfig& config, engine::IDspEngine& engine);

  PipelineOrchestrator(const PipelineOrchestrator&) = delete;
  PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

  PipelineResult Run(const MixAssets& assets,
                     const mix::MixRequest& request,
                     const RunOptions& options = RunOptions()) const;

  // The graphs Run() would submit for `request`, in stage order (one entry
  // when the run ends after stage 1).
  std::vector<mix::SignalGraph> PlanGraphs(const mix::MixRequest& request,
                                           bool with_song_clip = false) const;

 private:
  const mix::MixerConfig& config_;
  engine::IDspEngine& engine_;
  mix::SignalGraphBuilder builder_;
  StageExecutor executor_;
};

}  // namespace rtmix::pipeline

#endif  // RTMIX_PIPELINE_PIPELINE_ORCHESTRATOR_HPP_

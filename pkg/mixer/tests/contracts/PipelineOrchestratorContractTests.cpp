// Repository: RTMix
// Component: Pipeline orchestrator contract tests
// Purpose: State machine, early exits, failure isolation and artifact cleanup against a recording engine.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>

#include "fixtures/RecordingDspEngine.h"
#include "fixtures/TestFiles.h"
#include "rtmix/mix/MixRequest.hpp"
#include "rtmix/mix/MixerConfig.hpp"
#include "rtmix/pipeline/PipelineOrchestrator.hpp"
#include "rtmix/pipeline/PipelineTypes.hpp"
#include "rtmix/util/Logger.hpp"

namespace rtmix::pipeline {
namespace {

using tests::fixtures::FileExists;
using tests::fixtures::FileSize;
using tests::fixtures::RecordingDspEngine;
using tests::fixtures::ScratchDir;

class PipelineOrchestratorContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(root_.ok());
    work_root_ = root_.Join("work");
    ASSERT_EQ(mkdir(work_root_.c_str(), 0755), 0);
    config_.work_root = work_root_;

    assets_.intro_bed_path = root_.WriteFiller("intro.mp3", 2000);
    assets_.narration_path = root_.WriteFiller("narration.wav", 2000);
    assets_.outro_bed_path = root_.WriteFiller("outro.mp3", 2000);
  }

  PipelineResult RunWith(const mix::MixRequest& request,
                         const RunOptions& options = RunOptions()) {
    PipelineOrchestrator orchestrator(config_, engine_);
    return orchestrator.Run(assets_, request, options);
  }

  ScratchDir root_;
  std::string work_root_;
  mix::MixerConfig config_;
  RecordingDspEngine engine_;
  MixAssets assets_;
};

std::vector<std::pair<PipelineState, PipelineState>> Edges(const PipelineResult& r) {
  std::vector<std::pair<PipelineState, PipelineState>> edges;
  for (const auto& t : r.transitions) edges.emplace_back(t.from, t.to);
  return edges;
}

// -----------------------------------------------------------------------------
// Normal run
// -----------------------------------------------------------------------------

TEST_F(PipelineOrchestratorContractTest, NormalRunChainsThreeStages) {
  const PipelineResult r = RunWith(mix::MixRequest());
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(r.error, PipelineError::kNone);
  EXPECT_EQ(r.state, PipelineState::kDone);
  EXPECT_EQ(r.terminal, TerminalKind::kSucceeded);
  EXPECT_FALSE(r.early_exit());
  EXPECT_FALSE(r.run_id.empty());

  const auto jobs = engine_.jobs();
  ASSERT_EQ(jobs.size(), 3u);
  EXPECT_EQ(jobs[0].stage, 1);
  EXPECT_EQ(jobs[1].stage, 2);
  EXPECT_EQ(jobs[2].stage, 3);

  ASSERT_EQ(jobs[0].inputs.size(), 2u);
  EXPECT_EQ(jobs[0].inputs[0].name, "bed");
  EXPECT_EQ(jobs[0].inputs[0].path, assets_.intro_bed_path);
  EXPECT_EQ(jobs[0].inputs[1].name, "voice");
  EXPECT_EQ(jobs[0].inputs[1].path, assets_.narration_path);

  // Each stage reads only what the previous stage wrote.
  ASSERT_EQ(jobs[1].inputs.size(), 2u);
  EXPECT_EQ(jobs[1].inputs[0].path, jobs[0].output_path);
  EXPECT_EQ(jobs[1].inputs[1].path, assets_.outro_bed_path);
  ASSERT_EQ(jobs[2].inputs.size(), 1u);
  EXPECT_EQ(jobs[2].inputs[0].path, jobs[1].output_path);

  EXPECT_EQ(r.output_path, r.work_dir + "/rtmix_final_" + r.run_id + ".mp3");
  EXPECT_EQ(FileSize(r.output_path), static_cast<int64_t>(RecordingDspEngine::kOutputBytes));

  // Intermediates are gone; only the deliverable remains.
  EXPECT_FALSE(FileExists(jobs[0].output_path));
  EXPECT_FALSE(FileExists(jobs[1].output_path));

  const std::vector<std::pair<PipelineState, PipelineState>> expected = {
      {PipelineState::kResolving, PipelineState::kStage1},
      {PipelineState::kStage1, PipelineState::kStage2},
      {PipelineState::kStage2, PipelineState::kStage3},
      {PipelineState::kStage3, PipelineState::kDone},
  };
  EXPECT_EQ(Edges(r), expected);

  ASSERT_EQ(r.artifacts.size(), 3u);
  EXPECT_TRUE(r.artifacts[2].is_final);
  EXPECT_EQ(r.artifacts[2].path, r.output_path);
}

TEST_F(PipelineOrchestratorContractTest, ExplicitOutputPathReceivesFinalArtifact) {
  const std::string out = root_.Join("show.mp3");
  RunOptions options;
  options.output_path = out;

  const PipelineResult r = RunWith(mix::MixRequest(), options);
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(r.output_path, out);
  EXPECT_GT(FileSize(out), 0);
  // Nothing of the run is left in the work root.
  EXPECT_FALSE(FileExists(r.work_dir));
}

TEST_F(PipelineOrchestratorContractTest, GraphsAreLoggedWhenStagesRun) {
  std::vector<std::string> lines;
  std::mutex lines_mutex;
  util::Logger::SetInfoSink([&](const std::string& line) {
    std::lock_guard<std::mutex> lock(lines_mutex);
    lines.push_back(line);
  });
  const PipelineResult r = RunWith(mix::MixRequest());
  util::Logger::SetInfoSink(nullptr);
  ASSERT_TRUE(r.ok) << r.detail;

  int graph_lines = 0;
  for (const auto& line : lines) {
    if (line.find(" graph: ") != std::string::npos) ++graph_lines;
  }
  EXPECT_EQ(graph_lines, 3);
}

TEST_F(PipelineOrchestratorContractTest, VerifiedInputsAreReportedInDebugMode) {
  config_.debug_probe = true;
  assets_.song_clip_path = root_.WriteFiller("song.mp3", 2000);
  std::vector<std::string> lines;
  std::mutex lines_mutex;
  auto capture = [&](const std::string& line) {
    std::lock_guard<std::mutex> lock(lines_mutex);
    if (line.find("[StageExecutor] input ") != std::string::npos) lines.push_back(line);
  };
  util::Logger::SetInfoSink(capture);
  util::Logger::SetWarnSink(capture);
  const PipelineResult r = RunWith(mix::MixRequest());
  util::Logger::SetInfoSink(nullptr);
  util::Logger::SetWarnSink(nullptr);

  // Filler assets are not decodable: every report is a warning, the run
  // still succeeds.
  ASSERT_TRUE(r.ok) << r.detail;
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_NE(lines[0].find("input narration " + assets_.narration_path), std::string::npos);
  EXPECT_NE(lines[1].find("input intro_bed " + assets_.intro_bed_path), std::string::npos);
  EXPECT_NE(lines[2].find("input song_clip " + assets_.song_clip_path), std::string::npos);
  EXPECT_NE(lines[3].find("input outro_bed " + assets_.outro_bed_path), std::string::npos);
}

TEST_F(PipelineOrchestratorContractTest, InputsAreNotReportedByDefault) {
  std::vector<std::string> lines;
  std::mutex lines_mutex;
  auto capture = [&](const std::string& line) {
    std::lock_guard<std::mutex> lock(lines_mutex);
    if (line.find("[StageExecutor] input ") != std::string::npos) lines.push_back(line);
  };
  util::Logger::SetInfoSink(capture);
  util::Logger::SetWarnSink(capture);
  const PipelineResult r = RunWith(mix::MixRequest());
  util::Logger::SetInfoSink(nullptr);
  util::Logger::SetWarnSink(nullptr);
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_TRUE(lines.empty());
}

// -----------------------------------------------------------------------------
// Song clip
// -----------------------------------------------------------------------------

TEST_F(PipelineOrchestratorContractTest, SongClipIsThirdStage1Input) {
  assets_.song_clip_path = root_.WriteFiller("song.mp3", 2000);
  mix::MixRequest request;
  request.song_start_seconds = 4.0;

  const PipelineResult r = RunWith(request);
  ASSERT_TRUE(r.ok) << r.detail;

  const auto jobs = engine_.jobs();
  ASSERT_EQ(jobs.size(), 3u);
  ASSERT_EQ(jobs[0].inputs.size(), 3u);
  EXPECT_EQ(jobs[0].inputs[2].name, "song");
  EXPECT_EQ(jobs[0].inputs[2].path, assets_.song_clip_path);
  EXPECT_EQ(jobs[0].graph.inputs(), std::vector<std::string>({"bed", "voice", "song"}));
  EXPECT_NE(jobs[0].graph.FindNode("adelay"), nullptr);
  EXPECT_EQ(jobs[1].inputs.size(), 2u);
  EXPECT_EQ(r.transitions[0].note, "song_clip");
}

TEST_F(PipelineOrchestratorContractTest, VoiceOnlyIgnoresSongClip) {
  assets_.song_clip_path = root_.Join("never-written.mp3");
  mix::MixRequest request;
  request.voice_only = true;

  const PipelineResult r = RunWith(request);
  ASSERT_TRUE(r.ok) << r.detail;
  ASSERT_EQ(engine_.job_count(), 1u);
  EXPECT_EQ(engine_.jobs()[0].inputs.size(), 1u);
}

TEST_F(PipelineOrchestratorContractTest, UndersizedSongClipRejectedBeforeAnyEngineCall) {
  assets_.song_clip_path = root_.WriteFiller("song.mp3", 20);

  const PipelineResult r = RunWith(mix::MixRequest());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, PipelineError::kInvalidInput);
  EXPECT_EQ(r.failed_stage, 0);
  EXPECT_NE(r.detail.find("song_clip"), std::string::npos) << r.detail;
  EXPECT_EQ(engine_.job_count(), 0u);
}

// -----------------------------------------------------------------------------
// Diagnostic early exits
// -----------------------------------------------------------------------------

TEST_F(PipelineOrchestratorContractTest, VoiceOnlyRunsOnlyStage1WithoutBed) {
  assets_.intro_bed_path.clear();
  assets_.outro_bed_path.clear();
  mix::MixRequest request;
  request.voice_only = true;

  const PipelineResult r = RunWith(request);
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(r.state, PipelineState::kDoneEarly);
  EXPECT_EQ(r.terminal, TerminalKind::kSucceededVoiceOnly);
  EXPECT_TRUE(r.early_exit());

  const auto jobs = engine_.jobs();
  ASSERT_EQ(jobs.size(), 1u);
  EXPECT_FALSE(jobs[0].graph.ReferencesInput("bed"));
  ASSERT_EQ(jobs[0].inputs.size(), 1u);
  EXPECT_EQ(jobs[0].inputs[0].name, "voice");
  EXPECT_GT(FileSize(r.output_path), 0);
  // Promoted by rename: the stage file itself is gone.
  EXPECT_FALSE(FileExists(jobs[0].output_path));
}

TEST_F(PipelineOrchestratorContractTest, Step1OnlySkipsOutroAndNormalization) {
  assets_.outro_bed_path.clear();
  mix::MixRequest request;
  request.step1_only = true;

  const PipelineResult r = RunWith(request);
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(r.terminal, TerminalKind::kSucceededStep1Only);

  const auto jobs = engine_.jobs();
  ASSERT_EQ(jobs.size(), 1u);
  EXPECT_NE(jobs[0].graph.FindNode("amix"), nullptr);
  EXPECT_EQ(jobs[0].graph.FindNode("acrossfade"), nullptr);
  EXPECT_EQ(jobs[0].graph.FindNode("loudnorm"), nullptr);

  const std::vector<std::pair<PipelineState, PipelineState>> expected = {
      {PipelineState::kResolving, PipelineState::kStage1},
      {PipelineState::kStage1, PipelineState::kDoneEarly},
  };
  EXPECT_EQ(Edges(r), expected);
}

TEST_F(PipelineOrchestratorContractTest, VoiceOnlyTakesPrecedenceOverStep1Only) {
  mix::MixRequest request;
  request.voice_only = true;
  request.step1_only = true;

  const PipelineResult r = RunWith(request);
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(r.terminal, TerminalKind::kSucceededVoiceOnly);
  ASSERT_EQ(engine_.job_count(), 1u);
  EXPECT_EQ(engine_.jobs()[0].graph.FindNode("amix"), nullptr);
}

// -----------------------------------------------------------------------------
// Input rejection
// -----------------------------------------------------------------------------

TEST_F(PipelineOrchestratorContractTest, UndersizedNarrationRejectedBeforeAnyEngineCall) {
  assets_.narration_path = root_.WriteFiller("short.wav", 499);

  const PipelineResult r = RunWith(mix::MixRequest());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, PipelineError::kInvalidInput);
  EXPECT_EQ(r.failed_stage, 0);
  EXPECT_EQ(r.state, PipelineState::kFailed);
  EXPECT_TRUE(r.output_path.empty());
  EXPECT_EQ(engine_.job_count(), 0u);
  EXPECT_TRUE(r.work_dir.empty());

  const std::vector<std::pair<PipelineState, PipelineState>> expected = {
      {PipelineState::kResolving, PipelineState::kFailed},
  };
  EXPECT_EQ(Edges(r), expected);
}

TEST_F(PipelineOrchestratorContractTest, MissingBedsRejectedOnlyWhenUsed) {
  assets_.outro_bed_path = root_.Join("missing-outro.mp3");
  PipelineResult r = RunWith(mix::MixRequest());
  EXPECT_EQ(r.error, PipelineError::kInvalidInput);
  EXPECT_NE(r.detail.find("outro_bed"), std::string::npos) << r.detail;
  EXPECT_EQ(engine_.job_count(), 0u);

  mix::MixRequest step1;
  step1.step1_only = true;
  r = RunWith(step1);
  EXPECT_TRUE(r.ok) << r.detail;

  assets_.intro_bed_path = root_.WriteFiller("tiny-intro.mp3", 10);
  r = RunWith(step1);
  EXPECT_EQ(r.error, PipelineError::kInvalidInput);
  EXPECT_NE(r.detail.find("intro_bed"), std::string::npos) << r.detail;
}

TEST_F(PipelineOrchestratorContractTest, OutOfRangeRequestIsInvalidInput) {
  mix::MixRequest request;
  request.bed_volume = -1.0;
  const PipelineResult r = RunWith(request);
  EXPECT_EQ(r.error, PipelineError::kInvalidInput);
  EXPECT_EQ(engine_.job_count(), 0u);
}

// -----------------------------------------------------------------------------
// Configuration errors
// -----------------------------------------------------------------------------

TEST_F(PipelineOrchestratorContractTest, UnavailableEngineIsConfigurationError) {
  engine_.SetUnavailable("engine executable 'ffmpeg' not found");
  const PipelineResult r = RunWith(mix::MixRequest());
  EXPECT_EQ(r.error, PipelineError::kConfigurationError);
  EXPECT_EQ(r.failed_stage, 0);
  EXPECT_NE(r.detail.find("not found"), std::string::npos);
  EXPECT_EQ(engine_.job_count(), 0u);
}

TEST_F(PipelineOrchestratorContractTest, UnusableWorkRootOrOutputDirIsConfigurationError) {
  config_.work_root = root_.Join("no-such-dir");
  PipelineResult r = RunWith(mix::MixRequest());
  EXPECT_EQ(r.error, PipelineError::kConfigurationError);

  config_.work_root = work_root_;
  RunOptions options;
  options.output_path = root_.Join("no-such-dir/final.mp3");
  r = RunWith(mix::MixRequest(), options);
  EXPECT_EQ(r.error, PipelineError::kConfigurationError);
  EXPECT_EQ(engine_.job_count(), 0u);
}

// -----------------------------------------------------------------------------
// Engine failures and cleanup
// -----------------------------------------------------------------------------

TEST_F(PipelineOrchestratorContractTest, Stage2FailureLeavesNothingBehind) {
  engine_.FailStage(2, 1, "[Parsed_acrossfade_0] Invalid argument");

  const PipelineResult r = RunWith(mix::MixRequest());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, PipelineError::kEngineFailure);
  EXPECT_EQ(r.failed_stage, 2);
  EXPECT_EQ(r.state, PipelineState::kFailed);
  EXPECT_TRUE(r.output_path.empty());
  EXPECT_NE(r.detail.find("Invalid argument"), std::string::npos) << r.detail;
  EXPECT_EQ(engine_.job_count(), 2u);

  // Stage-1 artifact and stage-2 partial output are deleted with the work dir.
  ASSERT_EQ(r.artifacts.size(), 1u);
  EXPECT_FALSE(FileExists(r.artifacts[0].path));
  EXPECT_FALSE(FileExists(r.work_dir));
}

TEST_F(PipelineOrchestratorContractTest, Stage2FailureWithRetainKeepsIntermediates) {
  engine_.FailStage(2, 1, "boom");
  RunOptions options;
  options.retain_artifacts = true;

  const PipelineResult r = RunWith(mix::MixRequest(), options);
  EXPECT_EQ(r.error, PipelineError::kEngineFailure);
  EXPECT_EQ(r.failed_stage, 2);

  ASSERT_EQ(r.artifacts.size(), 1u);
  EXPECT_TRUE(FileExists(r.artifacts[0].path));
  EXPECT_TRUE(FileExists(r.work_dir + "/stage2.mp3"));
  EXPECT_FALSE(FileExists(r.work_dir + "/rtmix_final_" + r.run_id + ".mp3"));
}

TEST_F(PipelineOrchestratorContractTest, RetainFromConfigKeepsIntermediatesOnSuccess) {
  config_.retain_artifacts = true;
  const PipelineResult r = RunWith(mix::MixRequest());
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_TRUE(FileExists(r.work_dir + "/stage1.mp3"));
  EXPECT_TRUE(FileExists(r.work_dir + "/stage2.mp3"));
  EXPECT_TRUE(FileExists(r.output_path));
}

TEST_F(PipelineOrchestratorContractTest, FailedStageIndexIsReportedForStages1And3) {
  engine_.FailStage(1, 1, "stage one broke");
  PipelineResult r = RunWith(mix::MixRequest());
  EXPECT_EQ(r.failed_stage, 1);
  EXPECT_EQ(engine_.job_count(), 1u);

  RecordingDspEngine stage3_engine;
  stage3_engine.FailStage(3, 1, "loudnorm broke");
  PipelineOrchestrator orchestrator(config_, stage3_engine);
  r = orchestrator.Run(assets_, mix::MixRequest());
  EXPECT_EQ(r.failed_stage, 3);
  EXPECT_EQ(r.error, PipelineError::kEngineFailure);
  EXPECT_EQ(stage3_engine.job_count(), 3u);
}

TEST_F(PipelineOrchestratorContractTest, EmptyStageOutputIsEngineFailure) {
  engine_.SkipOutputOnStage(1);
  const PipelineResult r = RunWith(mix::MixRequest());
  EXPECT_EQ(r.error, PipelineError::kEngineFailure);
  EXPECT_EQ(r.failed_stage, 1);
  EXPECT_EQ(engine_.job_count(), 1u);
}

// -----------------------------------------------------------------------------
// Determinism and concurrency
// -----------------------------------------------------------------------------

TEST_F(PipelineOrchestratorContractTest, IdenticalRunsSubmitIdenticalJobs) {
  mix::MixRequest request;
  request.narration_delay_seconds = 0.3;
  request.crossfade_seconds = 2.0;

  ASSERT_TRUE(RunWith(request).ok);
  ASSERT_TRUE(RunWith(request).ok);

  const auto jobs = engine_.jobs();
  ASSERT_EQ(jobs.size(), 6u);
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(jobs[i].graph, jobs[i + 3].graph) << "stage " << (i + 1);
    EXPECT_EQ(jobs[i].encoding.ToJson(), jobs[i + 3].encoding.ToJson());
    EXPECT_EQ(jobs[i].inputs.size(), jobs[i + 3].inputs.size());
  }
  EXPECT_EQ(jobs[0].inputs[1].path, jobs[3].inputs[1].path);
  // Separate runs never share a work area.
  EXPECT_NE(jobs[0].output_path, jobs[3].output_path);
}

TEST_F(PipelineOrchestratorContractTest, ConcurrentRunsDoNotCollide) {
  PipelineOrchestrator orchestrator(config_, engine_);
  constexpr int kRuns = 8;
  std::vector<PipelineResult> results(kRuns);
  std::vector<std::thread> threads;
  for (int i = 0; i < kRuns; ++i) {
    threads.emplace_back([&, i]() { results[i] = orchestrator.Run(assets_, mix::MixRequest()); });
  }
  for (auto& t : threads) t.join();

  std::set<std::string> outputs;
  std::set<std::string> run_ids;
  for (const auto& r : results) {
    ASSERT_TRUE(r.ok) << r.detail;
    outputs.insert(r.output_path);
    run_ids.insert(r.run_id);
    EXPECT_TRUE(FileExists(r.output_path));
  }
  EXPECT_EQ(outputs.size(), static_cast<size_t>(kRuns));
  EXPECT_EQ(run_ids.size(), static_cast<size_t>(kRuns));
  EXPECT_EQ(engine_.job_count(), static_cast<size_t>(kRuns * 3));
}

TEST_F(PipelineOrchestratorContractTest, PlanGraphsMatchesRunLength) {
  PipelineOrchestrator orchestrator(config_, engine_);
  EXPECT_EQ(orchestrator.PlanGraphs(mix::MixRequest()).size(), 3u);
  mix::MixRequest step1;
  step1.step1_only = true;
  EXPECT_EQ(orchestrator.PlanGraphs(step1).size(), 1u);
  EXPECT_TRUE(orchestrator.PlanGraphs(step1, true)[0].ReferencesInput("song"));
}

}  // namespace
}  // namespace rtmix::pipeline

// Repository: RTMix
// Component: FFmpeg process engine unit tests
// Purpose: argv construction, exit/diagnostic capture and timeout using /bin/sh stand-in engines.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <string>
#include <vector>

#include "fixtures/TestFiles.h"
#include "rtmix/engine/FfmpegProcessEngine.hpp"
#include "rtmix/mix/SignalGraph.hpp"

namespace rtmix::engine {
namespace {

using tests::fixtures::FileSize;
using tests::fixtures::ScratchDir;

std::vector<std::string> ReadLines(const std::string& path) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);
  return lines;
}

EngineJob PassThroughJob(const std::string& input_path, const std::string& output_path) {
  EngineJob job;
  job.stage = 1;
  job.inputs = {{"voice", input_path}};
  job.graph.AddInput("voice");
  job.graph.AddNode("anull", {"voice"}, {"mix"});
  job.graph.SetOutput("mix");
  job.output_path = output_path;
  return job;
}

// Script that records its argv (one per line) and writes the last argument,
// minus the "file:" prefix, as a non-empty output file.
std::string RecordingScript(const ScratchDir& dir, const std::string& args_file) {
  return dir.WriteScript("fake-ffmpeg",
                         "printf '%s\\n' \"$@\" > '" + args_file + "'\n"
                         "for a; do last=$a; done\n"
                         "echo 'size=  12kB time=00:00:01.00'\n"
                         "printf 'encoded' > \"${last#file:}\"\n"
                         "exit 0");
}

// -----------------------------------------------------------------------------
// Argument construction
// -----------------------------------------------------------------------------

TEST(FfmpegProcessEngineTest, BuildArgumentsMatchesEngineContract) {
  FfmpegEngineConfig config;
  config.log_level = "error";
  FfmpegProcessEngine engine(config);

  EngineJob job = PassThroughJob("/in/voice.wav", "/out/stage1.mp3");
  const std::vector<std::string> expected = {
      "ffmpeg", "-hide_banner", "-nostdin", "-v", "error", "-y",
      "-i", "file:/in/voice.wav",
      "-filter_complex", "[0:a]anull[mix]",
      "-map", "[mix]",
      "-ar", "48000", "-ac", "2", "-c:a", "libmp3lame", "-b:a", "192k",
      "file:/out/stage1.mp3"};
  EXPECT_EQ(engine.BuildArguments(job), expected);
}

TEST(FfmpegProcessEngineTest, EngineConfigFollowsMixerConfig) {
  mix::MixerConfig mixer;
  mixer.engine_path = "/opt/ffmpeg";
  mixer.engine_log_level = "warning";
  mixer.stage_timeout_ms = 1234;
  const FfmpegEngineConfig config = FfmpegEngineConfig::FromMixerConfig(mixer);
  EXPECT_EQ(config.executable, "/opt/ffmpeg");
  EXPECT_EQ(config.log_level, "warning");
  EXPECT_EQ(config.timeout_ms, 1234);
}

// -----------------------------------------------------------------------------
// Process execution
// -----------------------------------------------------------------------------

TEST(FfmpegProcessEngineTest, SubmitPassesArgvVerbatimWithoutShell) {
  ScratchDir dir;
  ASSERT_TRUE(dir.ok());
  const std::string args_file = dir.Join("argv.txt");

  FfmpegEngineConfig config;
  config.executable = RecordingScript(dir, args_file);
  FfmpegProcessEngine engine(config);

  // Shell metacharacters must reach the engine untouched.
  const std::string input = dir.WriteFiller("voice; touch pwned $(id).wav", 1000);
  const std::string output = dir.Join("stage 1.mp3");
  const EngineJob job = PassThroughJob(input, output);

  const EngineResult result = engine.Submit(job);
  ASSERT_TRUE(result.success) << result.diagnostic;
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_NE(result.diagnostic.find("size="), std::string::npos);
  EXPECT_GT(FileSize(output), 0);
  EXPECT_FALSE(tests::fixtures::FileExists(dir.Join("pwned")));

  std::vector<std::string> expected = engine.BuildArguments(job);
  expected.erase(expected.begin());  // argv[0]
  EXPECT_EQ(ReadLines(args_file), expected);
}

TEST(FfmpegProcessEngineTest, NonZeroExitIsFailureWithDiagnostic) {
  ScratchDir dir;
  ASSERT_TRUE(dir.ok());
  FfmpegEngineConfig config;
  config.executable = dir.WriteScript(
      "failing-ffmpeg", "echo 'No such filter: sidechaincompress' >&2\nexit 3");
  FfmpegProcessEngine engine(config);

  const EngineResult result =
      engine.Submit(PassThroughJob(dir.WriteFiller("v.wav", 1000), dir.Join("o.mp3")));
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_NE(result.diagnostic.find("No such filter"), std::string::npos) << result.diagnostic;
}

TEST(FfmpegProcessEngineTest, DeathBySignalReportsShellStyleExitCode) {
  ScratchDir dir;
  ASSERT_TRUE(dir.ok());
  FfmpegEngineConfig config;
  config.executable = dir.WriteScript("killed-ffmpeg", "kill -TERM $$");
  FfmpegProcessEngine engine(config);

  const EngineResult result =
      engine.Submit(PassThroughJob(dir.WriteFiller("v.wav", 1000), dir.Join("o.mp3")));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.exit_code, 128 + 15);
}

TEST(FfmpegProcessEngineTest, TimeoutTerminatesEngine) {
  ScratchDir dir;
  ASSERT_TRUE(dir.ok());
  FfmpegEngineConfig config;
  config.executable = dir.WriteScript("hung-ffmpeg", "echo started\nexec sleep 30");
  config.timeout_ms = 300;
  config.kill_grace_ms = 200;
  FfmpegProcessEngine engine(config);

  const auto start = std::chrono::steady_clock::now();
  const EngineResult result =
      engine.Submit(PassThroughJob(dir.WriteFiller("v.wav", 1000), dir.Join("o.mp3")));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.timed_out);
  EXPECT_NE(result.diagnostic.find("timed out after 300 ms"), std::string::npos)
      << result.diagnostic;
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

// -----------------------------------------------------------------------------
// Pre-spawn rejection
// -----------------------------------------------------------------------------

TEST(FfmpegProcessEngineTest, MissingExecutableIsUnavailable) {
  FfmpegEngineConfig config;
  config.executable = "/nonexistent/rtmix/ffmpeg";
  FfmpegProcessEngine engine(config);

  std::string reason;
  EXPECT_FALSE(engine.IsAvailable(&reason));
  EXPECT_NE(reason.find("/nonexistent/rtmix/ffmpeg"), std::string::npos);

  const EngineResult result = engine.Submit(PassThroughJob("/in.wav", "/out.mp3"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.exit_code, -1);
}

TEST(FfmpegProcessEngineTest, InvalidGraphOrInputBindingIsRejectedBeforeSpawn) {
  ScratchDir dir;
  ASSERT_TRUE(dir.ok());
  const std::string marker = dir.Join("spawned");
  FfmpegEngineConfig config;
  config.executable = dir.WriteScript("marker-ffmpeg", "touch '" + marker + "'");
  FfmpegProcessEngine engine(config);

  EngineJob dangling = PassThroughJob("/in.wav", "/out.mp3");
  dangling.graph.SetOutput("nowhere");
  EngineResult result = engine.Submit(dangling);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.diagnostic.find("invalid signal graph"), std::string::npos);

  EngineJob misbound = PassThroughJob("/in.wav", "/out.mp3");
  misbound.inputs[0].name = "bed";
  result = engine.Submit(misbound);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.diagnostic.find("out of order"), std::string::npos);

  EngineJob extra = PassThroughJob("/in.wav", "/out.mp3");
  extra.inputs.push_back({"outro", "/outro.wav"});
  result = engine.Submit(extra);
  EXPECT_FALSE(result.success);

  EXPECT_FALSE(tests::fixtures::FileExists(marker));
}

TEST(FfmpegProcessEngineTest, ResolveExecutableSearchesPath) {
  EXPECT_FALSE(FfmpegProcessEngine::ResolveExecutable("sh").empty());
  EXPECT_TRUE(FfmpegProcessEngine::ResolveExecutable("rtmix-no-such-binary-7f3a").empty());
  EXPECT_TRUE(FfmpegProcessEngine::ResolveExecutable("").empty());
}

}  // namespace
}  // namespace rtmix::engine

// Repository: RTMix
// Component: FFmpeg Process Engine
// Purpose: Run one signal graph per ffmpeg child process, capture its diagnostics.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_ENGINE_FFMPEG_PROCESS_ENGINE_HPP_
#define RTMIX_ENGINE_FFMPEG_PROCESS_ENGINE_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "rtmix/engine/IDspEngine.hpp"
#include "rtmix/mix/MixerConfig.hpp"

namespace rtmix::engine {

struct FfmpegEngineConfig {
  std::string executable = "ffmpeg";  // bare name → searched on PATH
  std::string log_level = "info";     // passed as -v
  int64_t timeout_ms = 0;             // 0 = wait forever
  int64_t kill_grace_ms = 2000;       // SIGTERM → SIGKILL delay on timeout
  size_t max_diagnostic_bytes = 256 * 1024;  // tail of output kept

  // executable, log_level and timeout_ms from the process config.
  static FfmpegEngineConfig FromMixerConfig(const mix::MixerConfig& config);
};

// FfmpegProcessEngine executes each EngineJob as:
//
//   ffmpeg -hide_banner -nostdin -v <level> -y
//          -i <in0> -i <in1> ... -filter_complex <graph>
//          -map [<out>] -ar <rate> -ac <ch> -c:a <codec> -b:a <kbps>k <output>
//
// The child is exec'd directly from an argv vector (no shell), so paths and
// graph text are never re-interpreted. stdout and stderr share one pipe and
// are returned as the diagnostic text.
//
// Thread Safety:
// - Submit() may be called concurrently; each call owns its child and pipe.
//   Pipe fds are close-on-exec so concurrent children do not inherit them.
//
// Timeout:
// - When timeout_ms > 0 and the child outlives it, it receives SIGTERM, then
//   SIGKILL after kill_grace_ms. The result has timed_out=true.
class FfmpegProcessEngine : public IDspEngine {
 public:
  explicit FfmpegProcessEngine(FfmpegEngineConfig config);
  ~FfmpegProcessEngine() override = default;

  FfmpegProcessEngine(const FfmpegProcessEngine&) = delete;
  FfmpegProcessEngine& operator=(const FfmpegProcessEngine&) = delete;

  EngineResult Submit(const EngineJob& job) override;

  bool IsAvailable(std::string* reason) const override;

  // Full argv (argv[0] = executable as configured) for a job.
  std::vector<std::string> BuildArguments(const EngineJob& job) const;

  // Resolve a bare executable name against PATH. Returns empty string when
  // nothing executable is found.
  static std::string ResolveExecutable(const std::string& name);

 private:
  FfmpegEngineConfig config_;
};

}  // namespace rtmix::engine

#endif  // RTMIX_ENGINE_FFMPEG_PROCESS_ENGINE_HPP_

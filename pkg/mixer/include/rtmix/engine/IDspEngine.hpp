// Repository: RTMix
// Component: DSP Engine Interface
// Purpose: Graph-submission contract between the pipeline and the external DSP engine.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_ENGINE_IDSP_ENGINE_HPP_
#define RTMIX_ENGINE_IDSP_ENGINE_HPP_

#include <string>
#include <utility>
#include <vector>

#include "rtmix/mix/OutputEncoding.hpp"
#include "rtmix/mix/SignalGraph.hpp"

namespace rtmix::engine {

// One named input stream bound to a file. Order matches graph.inputs().
struct EngineInput {
  std::string name;
  std::string path;
};

// EngineJob is one graph submission: named inputs, the graph that
// references them by name, and how to encode graph.output() to output_path.
struct EngineJob {
  int stage = 0;  // 1-based pipeline stage, for diagnostics only
  std::vector<EngineInput> inputs;
  mix::SignalGraph graph;
  mix::OutputEncoding encoding;
  std::string output_path;
};

struct EngineResult {
  bool success = false;
  int exit_code = -1;
  bool timed_out = false;
  std::string diagnostic;  // captured stdout/stderr of the engine

  static EngineResult Success(std::string diagnostic = "") {
    return {true, 0, false, std::move(diagnostic)};
  }

  static EngineResult Failure(int exit_code, std::string diagnostic,
                              bool timed_out = false) {
    return {false, exit_code, timed_out, std::move(diagnostic)};
  }
};

// IDspEngine executes signal graphs. Submit() blocks until the engine
// finishes (or the implementation's deadline expires). Implementations must
// be safe to call from several threads at once for independent jobs.
class IDspEngine {
 public:
  virtual ~IDspEngine() = default;

  virtual EngineResult Submit(const EngineJob& job) = 0;

  // False when the engine cannot run at all (binary missing, etc.).
  virtual bool IsAvailable(std::string* reason) const = 0;
};

}  // namespace rtmix::engine

#endif  // RTMIX_ENGINE_IDSP_ENGINE_HPP_

// Repository: RTMix
// Component: Recording DSP Engine
// Purpose: Test double for IDspEngine that records jobs and writes fake stage outputs.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_TESTS_FIXTURES_RECORDING_DSP_ENGINE_H_
#define RTMIX_TESTS_FIXTURES_RECORDING_DSP_ENGINE_H_

#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "rtmix/engine/IDspEngine.hpp"

namespace rtmix::tests::fixtures {

// RecordingDspEngine captures every submitted job. On success it writes
// kOutputBytes of filler to job.output_path; a stage configured to fail
// writes a short partial file (like a real engine killed mid-encode) and
// returns the configured exit code and diagnostic.
class RecordingDspEngine : public engine::IDspEngine {
 public:
  static constexpr size_t kOutputBytes = 4096;

  struct Failure {
    int exit_code = 1;
    std::string diagnostic;
    bool timed_out = false;
  };

  RecordingDspEngine() = default;

  engine::EngineResult Submit(const engine::EngineJob& job) override {
    Failure failure;
    bool fail = false;
    bool skip_output = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      jobs_.push_back(job);
      auto it = failures_.find(job.stage);
      if (it != failures_.end()) {
        fail = true;
        failure = it->second;
      }
      skip_output = skip_output_stages_.count(job.stage) > 0;
    }

    if (fail) {
      WriteFiller(job.output_path, 100);
      return engine::EngineResult::Failure(failure.exit_code, failure.diagnostic,
                                           failure.timed_out);
    }
    if (!skip_output) {
      WriteFiller(job.output_path, kOutputBytes);
    }
    return engine::EngineResult::Success("fake engine: stage " + std::to_string(job.stage));
  }

  bool IsAvailable(std::string* reason) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!available_ && reason != nullptr) *reason = unavailable_reason_;
    return available_;
  }

  // Stage `stage` returns failure.
  void FailStage(int stage, int exit_code, std::string diagnostic, bool timed_out = false) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[stage] = Failure{exit_code, std::move(diagnostic), timed_out};
  }

  // Stage `stage` reports success without writing anything.
  void SkipOutputOnStage(int stage) {
    std::lock_guard<std::mutex> lock(mutex_);
    skip_output_stages_.insert(stage);
  }

  void SetUnavailable(std::string reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = false;
    unavailable_reason_ = std::move(reason);
  }

  std::vector<engine::EngineJob> jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_;
  }

  size_t job_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
  }

 private:
  static void WriteFiller(const std::string& path, size_t bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    const std::string filler(bytes, 'R');
    out.write(filler.data(), static_cast<std::streamsize>(filler.size()));
  }

  mutable std::mutex mutex_;
  std::vector<engine::EngineJob> jobs_;
  std::map<int, Failure> failures_;
  std::set<int> skip_output_stages_;
  bool available_ = true;
  std::string unavailable_reason_;
};

}  // namespace rtmix::tests::fixtures

#endif  // RTMIX_TESTS_FIXTURES_RECORDING_DSP_ENGINE_H_

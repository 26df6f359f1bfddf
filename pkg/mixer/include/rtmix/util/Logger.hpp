// Repository: RTMix
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for concurrent pipeline runs.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_UTIL_LOGGER_HPP_
#define RTMIX_UTIL_LOGGER_HPP_

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace rtmix::util {

// True only when the variable is set to exactly "1".
bool EnvFlagIsOne(const char* name);

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so concurrent pipeline runs (one per gRPC worker) never interleave
// partial lines.
//
// Info  → stdout (normal operational logs, stage graphs)
// Debug → stdout only when RTMIX_DEBUG=1 (engine diagnostics, graph dumps)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (stage failures, rejected inputs)
//
// Test-only: SetErrorSink / SetWarnSink / SetInfoSink install a callback
// invoked for every Error() / Warn() / Info() line (in addition to the
// stream). Enabled Debug() lines go to the info sink.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // RTMIX_DEBUG=1, read once on first use. Same rule as
  // MixerConfig::ApplyEnvironment().
  static bool DebugEnabled();
  static void SetDebugEnabled(bool enabled);
  // Forget the cached value; the next DebugEnabled() rereads RTMIX_DEBUG.
  static void ReloadDebugFromEnvironment();

  // Test-only: call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::atomic<int> debug_state_;  // -1 unread, 0 off, 1 on
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace rtmix::util

#endif  // RTMIX_UTIL_LOGGER_HPP_

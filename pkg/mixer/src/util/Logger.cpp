// Repository: RTMix
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission for concurrent pipeline runs.
// Copyright (c) 2025 RetroVue

#include "rtmix/util/Logger.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <utility>

namespace rtmix::util {

bool EnvFlagIsOne(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && std::strcmp(value, "1") == 0;
}

std::mutex Logger::mutex_;
std::atomic<int> Logger::debug_state_{-1};
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::info_sink_;

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

bool Logger::DebugEnabled() {
  int state = debug_state_.load();
  if (state < 0) {
    state = EnvFlagIsOne("RTMIX_DEBUG") ? 1 : 0;
    debug_state_.store(state);
  }
  return state == 1;
}

void Logger::SetDebugEnabled(bool enabled) {
  debug_state_.store(enabled ? 1 : 0);
}

void Logger::ReloadDebugFromEnvironment() {
  debug_state_.store(-1);
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (warn_sink_) {
    warn_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

}  // namespace rtmix::util

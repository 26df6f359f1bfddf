// Repository: RTMix
// Component: rtmixd
// Purpose: gRPC daemon hosting the MixControl service.
// Copyright (c) 2025 RetroVue

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "MixService.h"
#include "rtmix/engine/FfmpegProcessEngine.hpp"
#include "rtmix/engine/StreamProbe.hpp"
#include "rtmix/mix/MixerConfig.hpp"
#include "rtmix/util/Logger.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string config_path;
  std::string listen_address;
  std::string work_root;
  bool retain = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "RTMix mixing daemon (gRPC MixControl service).\n"
            << "\n"
            << "  --config PATH        JSON MixerConfig file\n"
            << "  --listen ADDR        Listen address (default: 127.0.0.1:50071)\n"
            << "  --work-root DIR      Parent directory for per-run work areas\n"
            << "  --retain             Keep intermediate stage artifacts\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "Environment: RTMIX_DEBUG=1, RTMIX_FFMPEG=PATH, RTMIX_WORK_ROOT=DIR\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--listen" && i + 1 < argc) {
      args.listen_address = argv[++i];
    } else if (arg == "--work-root" && i + 1 < argc) {
      args.work_root = argv[++i];
    } else if (arg == "--retain") {
      args.retain = true;
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }
  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  using rtmix::util::Logger;

  const CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 2;
  }

  rtmix::mix::MixerConfig config;
  if (!args.config_path.empty()) {
    auto loaded = rtmix::mix::MixerConfig::FromFile(args.config_path);
    if (!loaded) {
      Logger::Error("[rtmixd] cannot load config " + args.config_path);
      return 2;
    }
    config = *loaded;
  }
  config.ApplyEnvironment();
  if (!args.listen_address.empty()) config.listen_address = args.listen_address;
  if (!args.work_root.empty()) config.work_root = args.work_root;
  if (args.retain) config.retain_artifacts = true;

  if (!config.IsValid()) {
    Logger::Error("[rtmixd] invalid configuration: " + config.ToJson());
    return 2;
  }
  Logger::Info("[rtmixd] config " + config.ToJson());

  rtmix::engine::FfmpegProcessEngine engine(
      rtmix::engine::FfmpegEngineConfig::FromMixerConfig(config));
  std::string reason;
  if (!engine.IsAvailable(&reason)) {
    // Keep serving; every run reports CONFIGURATION_ERROR until fixed.
    Logger::Warn("[rtmixd] " + reason);
  }
  if (config.debug_probe && !rtmix::engine::StreamProbe::Available()) {
    Logger::Warn("[rtmixd] debug probe requested but built without FFmpeg libraries");
  }

  rtmix::service::MixControlImpl service(config, engine);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    Logger::Error("[rtmixd] failed to listen on " + config.listen_address);
    return 1;
  }
  Logger::Info("[rtmixd] MixControl listening on " + config.listen_address);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::thread watcher([&server]() {
    while (!g_termination_requested.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    Logger::Info("[rtmixd] shutdown requested");
    server->Shutdown();
  });

  server->Wait();
  g_termination_requested.store(true, std::memory_order_release);
  watcher.join();
  Logger::Info("[rtmixd] stopped");
  return 0;
}

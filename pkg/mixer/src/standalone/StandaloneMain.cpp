// Repository: RTMix
// Component: Standalone Mixing Harness
// Purpose: Run one intro/narration/outro mix from the command line.
// Copyright (c) 2025 RetroVue
//
// This binary is for diagnostics and batch use. It drives the same
// orchestrator as rtmixd, with knobs taken from the command line.
//
// EXIT CODES:
//   0  success (including voice_only / step1_only early exit)
//   1  engine failure
//   2  invalid input, invalid arguments or configuration error

#include <exception>
#include <iostream>
#include <string>

#include "rtmix/engine/FfmpegProcessEngine.hpp"
#include "rtmix/engine/FilterGraphSerializer.hpp"
#include "rtmix/mix/MixerConfig.hpp"
#include "rtmix/mix/ParameterResolver.hpp"
#include "rtmix/pipeline/PipelineOrchestrator.hpp"
#include "rtmix/util/Logger.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitEngineFailure = 1;
constexpr int kExitInvalid = 2;

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string intro_path;
  std::string narration_path;
  std::string outro_path;
  std::string song_path;
  std::string output_path;
  std::string config_path;
  rtmix::mix::KnobSource knobs;
  bool retain = false;
  bool print_graphs = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --intro PATH --narr PATH --outro PATH --out PATH [KNOBS]\n"
            << "\n"
            << "Mix an intro bed under narration, crossfade into an outro bed and\n"
            << "loudness-normalize the result.\n"
            << "\n"
            << "INPUTS / OUTPUT:\n"
            << "  --intro PATH         Intro background bed\n"
            << "  --narr PATH          Narration (dry voice)\n"
            << "  --outro PATH         Outro bed\n"
            << "  --song PATH          Optional song clip laid over stage 1 (mutes the bed)\n"
            << "  --out PATH           Output file\n"
            << "\n"
            << "KNOBS (--key VALUE; legacy aliases accepted):\n";
  for (const auto& knob : rtmix::mix::ParameterResolver::Knobs()) {
    std::cerr << "  --" << knob.key;
    for (const auto& alias : knob.aliases) std::cerr << " | --" << alias;
    std::cerr << (knob.is_flag ? "  (flag)" : " VALUE") << "\n";
  }
  std::cerr << "\n"
            << "OPTIONS:\n"
            << "  --config PATH        JSON MixerConfig file\n"
            << "  --retain             Keep intermediate stage artifacts\n"
            << "  --print-graphs       Print the stage graphs and exit (no engine run)\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --intro bed.mp3 --narr voice.wav --outro outro.mp3 \\\n"
            << "      --out show.mp3 --bg_vol 0.3 --xfade 1.5\n"
            << "  " << program_name << " --narr voice.wav --out check.mp3 --voice_only\n";
}

const rtmix::mix::ParameterResolver::KnobInfo* FindKnob(const std::string& name) {
  for (const auto& knob : rtmix::mix::ParameterResolver::Knobs()) {
    if (knob.key == name) return &knob;
    for (const auto& alias : knob.aliases) {
      if (alias == name) return &knob;
    }
  }
  return nullptr;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--intro" && i + 1 < argc) {
      args.intro_path = argv[++i];
    } else if (arg == "--narr" && i + 1 < argc) {
      args.narration_path = argv[++i];
    } else if (arg == "--outro" && i + 1 < argc) {
      args.outro_path = argv[++i];
    } else if (arg == "--song" && i + 1 < argc) {
      args.song_path = argv[++i];
    } else if (arg == "--out" && i + 1 < argc) {
      args.output_path = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--retain") {
      args.retain = true;
    } else if (arg == "--print-graphs") {
      args.print_graphs = true;
    } else if (arg.rfind("--", 0) == 0 && FindKnob(arg.substr(2)) != nullptr) {
      const std::string name = arg.substr(2);
      if (FindKnob(name)->is_flag) {
        // Bare flag, or an explicit 0/1.
        std::string value = "1";
        if (i + 1 < argc && (std::string(argv[i + 1]) == "0" || std::string(argv[i + 1]) == "1")) {
          value = argv[++i];
        }
        args.knobs[name] = value;
      } else if (i + 1 < argc) {
        args.knobs[name] = argv[++i];
      } else {
        args.error = "Missing value for " + arg;
        return args;
      }
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }

  if (!args.print_graphs) {
    if (args.narration_path.empty()) {
      args.error = "--narr is required";
      return args;
    }
    if (args.output_path.empty()) {
      args.error = "--out is required";
      return args;
    }
  }

  args.valid = true;
  return args;
}

int Run(const CliArgs& args) {
  using rtmix::util::Logger;

  rtmix::mix::MixerConfig config;
  if (!args.config_path.empty()) {
    auto loaded = rtmix::mix::MixerConfig::FromFile(args.config_path);
    if (!loaded) {
      Logger::Error("[HARNESS] cannot load config " + args.config_path);
      return kExitInvalid;
    }
    config = *loaded;
  }
  config.ApplyEnvironment();
  if (args.retain) config.retain_artifacts = true;
  if (!config.IsValid()) {
    Logger::Error("[HARNESS] invalid configuration: " + config.ToJson());
    return kExitInvalid;
  }

  const rtmix::mix::MixRequest request = rtmix::mix::ParameterResolver::Resolve(args.knobs);

  rtmix::engine::FfmpegProcessEngine engine(
      rtmix::engine::FfmpegEngineConfig::FromMixerConfig(config));
  rtmix::pipeline::PipelineOrchestrator orchestrator(config, engine);

  if (args.print_graphs) {
    std::cout << "request: " << request.ToString() << "\n";
    int stage = 1;
    for (const auto& graph : orchestrator.PlanGraphs(request, !args.song_path.empty())) {
      std::cout << "\n--- stage " << stage++ << " ---\n"
                << graph.Describe() << "\n"
                << "filter_complex: " << rtmix::engine::SerializeFilterComplex(graph) << "\n";
    }
    return kExitOk;
  }

  rtmix::pipeline::MixAssets assets;
  assets.intro_bed_path = args.intro_path;
  assets.narration_path = args.narration_path;
  assets.outro_bed_path = args.outro_path;
  assets.song_clip_path = args.song_path;

  rtmix::pipeline::RunOptions options;
  options.output_path = args.output_path;

  const rtmix::pipeline::PipelineResult result = orchestrator.Run(assets, request, options);
  if (result.ok) {
    std::cout << "[OK] " << rtmix::pipeline::ToString(result.terminal) << " -> "
              << result.output_path << "\n";
    return kExitOk;
  }

  std::cerr << "[FAILED] " << rtmix::pipeline::ToString(result.error)
            << " stage=" << result.failed_stage << "\n"
            << result.detail << "\n";
  return result.error == rtmix::pipeline::PipelineError::kEngineFailure ? kExitEngineFailure
                                                                         : kExitInvalid;
}

}  // namespace

int main(int argc, char* argv[]) {
  const CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitInvalid;
  }

  try {
    return Run(args);
  } catch (const std::exception& e) {
    rtmix::util::Logger::Error(std::string("[HARNESS] fatal: ") + e.what());
    return kExitEngineFailure;
  }
}

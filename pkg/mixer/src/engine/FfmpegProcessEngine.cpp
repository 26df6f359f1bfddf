// Repository: RTMix
// Component: FFmpeg Process Engine
// Purpose: Run one signal graph per ffmpeg child process, capture its diagnostics.
// Copyright (c) 2025 RetroVue

#include "rtmix/engine/FfmpegProcessEngine.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "rtmix/engine/FilterGraphSerializer.hpp"
#include "rtmix/util/Logger.hpp"

namespace rtmix::engine {

namespace {

bool IsExecutableFile(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return false;
  if (!S_ISREG(st.st_mode)) return false;
  return access(path.c_str(), X_OK) == 0;
}

// Keep only the last `cap` bytes; engine banners can be long.
void AppendBounded(std::string& out, const char* data, size_t len, size_t cap) {
  out.append(data, len);
  if (cap > 0 && out.size() > cap) {
    out.erase(0, out.size() - cap);
  }
}

// Reap child, retrying on EINTR. Returns raw wait status or -1.
int WaitForChild(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) return -1;
  }
  return status;
}

// SIGTERM, wait up to grace_ms, then SIGKILL. Returns raw wait status.
int TerminateChild(pid_t pid, int64_t grace_ms) {
  kill(pid, SIGTERM);
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    int status = 0;
    const pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) return status;
    if (r < 0 && errno != EINTR) return -1;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  kill(pid, SIGKILL);
  return WaitForChild(pid);
}

int ExitCodeFromStatus(int status) {
  if (status < 0) return -1;
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

// "file:" keeps ffmpeg from reading '-' as stdin or "x:y" as a protocol.
std::string FileUrl(const std::string& path) {
  return "file:" + path;
}

}  // namespace

FfmpegEngineConfig FfmpegEngineConfig::FromMixerConfig(const mix::MixerConfig& config) {
  FfmpegEngineConfig out;
  out.executable = config.engine_path;
  out.log_level = config.engine_log_level;
  out.timeout_ms = config.stage_timeout_ms;
  return out;
}

FfmpegProcessEngine::FfmpegProcessEngine(FfmpegEngineConfig config)
    : config_(std::move(config)) {}

std::string FfmpegProcessEngine::ResolveExecutable(const std::string& name) {
  if (name.empty()) return "";
  if (name.find('/') != std::string::npos) {
    return IsExecutableFile(name) ? name : "";
  }

  const char* path_env = std::getenv("PATH");
  const std::string search = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
  size_t begin = 0;
  while (begin <= search.size()) {
    size_t end = search.find(':', begin);
    if (end == std::string::npos) end = search.size();
    std::string dir = search.substr(begin, end - begin);
    if (dir.empty()) dir = ".";
    const std::string candidate = dir + "/" + name;
    if (IsExecutableFile(candidate)) return candidate;
    begin = end + 1;
  }
  return "";
}

bool FfmpegProcessEngine::IsAvailable(std::string* reason) const {
  if (!ResolveExecutable(config_.executable).empty()) return true;
  if (reason != nullptr) {
    *reason = "engine executable '" + config_.executable + "' not found or not executable";
  }
  return false;
}

std::vector<std::string> FfmpegProcessEngine::BuildArguments(const EngineJob& job) const {
  std::vector<std::string> args = {
      config_.executable, "-hide_banner", "-nostdin", "-v", config_.log_level, "-y"};
  for (const auto& input : job.inputs) {
    args.push_back("-i");
    args.push_back(FileUrl(input.path));
  }
  args.push_back("-filter_complex");
  args.push_back(SerializeFilterComplex(job.graph));
  args.push_back("-map");
  args.push_back("[" + job.graph.output() + "]");
  args.push_back("-ar");
  args.push_back(std::to_string(job.encoding.sample_rate));
  args.push_back("-ac");
  args.push_back(std::to_string(job.encoding.channels));
  args.push_back("-c:a");
  args.push_back(job.encoding.codec);
  args.push_back("-b:a");
  args.push_back(std::to_string(job.encoding.bitrate_kbps) + "k");
  args.push_back(FileUrl(job.output_path));
  return args;
}

EngineResult FfmpegProcessEngine::Submit(const EngineJob& job) {
  std::string graph_error;
  if (!job.graph.Validate(&graph_error)) {
    return EngineResult::Failure(-1, "invalid signal graph: " + graph_error);
  }
  if (job.inputs.size() != job.graph.inputs().size()) {
    return EngineResult::Failure(-1, "input count does not match graph inputs");
  }
  for (size_t i = 0; i < job.inputs.size(); ++i) {
    if (job.inputs[i].name != job.graph.inputs()[i]) {
      return EngineResult::Failure(
          -1, "input '" + job.inputs[i].name + "' bound out of order (graph expects '" +
                  job.graph.inputs()[i] + "')");
    }
  }

  const std::string executable = ResolveExecutable(config_.executable);
  if (executable.empty()) {
    return EngineResult::Failure(
        -1, "engine executable '" + config_.executable + "' not found");
  }

  // Everything the child touches is prepared before fork().
  const std::vector<std::string> args = BuildArguments(job);
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    return EngineResult::Failure(-1, std::string("pipe2 failed: ") + std::strerror(errno));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    close(fds[0]);
    close(fds[1]);
    return EngineResult::Failure(-1, std::string("fork failed: ") + std::strerror(err));
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    dup2(fds[1], STDOUT_FILENO);
    dup2(fds[1], STDERR_FILENO);
    execv(executable.c_str(), argv.data());
    static const char kExecFailed[] = "rtmix: exec of engine failed\n";
    ssize_t ignored = write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
    (void)ignored;
    _exit(127);
  }

  close(fds[1]);

  {
    std::ostringstream oss;
    oss << "[FfmpegProcessEngine] stage=" << job.stage << " pid=" << pid
        << " exec=" << executable;
    util::Logger::Debug(oss.str());
  }

  std::string output;
  bool timed_out = false;
  char buffer[4096];
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    int wait_ms = -1;
    if (config_.timeout_ms > 0) {
      const int64_t elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - started)
                                  .count();
      const int64_t remaining = config_.timeout_ms - elapsed;
      if (remaining <= 0) {
        timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(remaining > 1000 ? 1000 : remaining);
    }

    struct pollfd pfd;
    pfd.fd = fds[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int pr = poll(&pfd, 1, wait_ms);
    if (pr < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (pr == 0) continue;

    const ssize_t n = read(fds[0], buffer, sizeof(buffer));
    if (n > 0) {
      AppendBounded(output, buffer, static_cast<size_t>(n), config_.max_diagnostic_bytes);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;  // EOF: child closed its end
  }
  close(fds[0]);

  const int status = timed_out ? TerminateChild(pid, config_.kill_grace_ms)
                               : WaitForChild(pid);
  const int exit_code = ExitCodeFromStatus(status);

  if (timed_out) {
    std::ostringstream oss;
    oss << output << "\n[engine timed out after " << config_.timeout_ms << " ms]";
    return EngineResult::Failure(exit_code, oss.str(), true);
  }
  if (exit_code != 0) {
    return EngineResult::Failure(exit_code, output);
  }
  return EngineResult::Success(output);
}

}  // namespace rtmix::engine

// Repository: RTMix
// Component: Work Area
// Purpose: Per-run scratch directory, run ids, artifact promotion and cleanup.
// Copyright (c) 2025 RetroVue

#include "rtmix/pipeline/WorkArea.hpp"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace rtmix::pipeline {

namespace fs = std::filesystem;

namespace {

std::atomic<uint64_t> g_run_counter{0};

}  // namespace

WorkArea::WorkArea(std::string dir, std::string run_id)
    : dir_(std::move(dir)), run_id_(std::move(run_id)) {}

std::string WorkArea::NewRunId() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::random_device rd;
  const uint32_t salt = rd();
  const uint64_t seq = ++g_run_counter;

  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%04d%02d%02dT%02d%02d%02dZ-%llu-%08x",
                              tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                              tm.tm_hour, tm.tm_min, tm.tm_sec,
                              static_cast<unsigned long long>(seq), salt);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) {
    return "run-" + std::to_string(seq);
  }
  return std::string(buf, static_cast<size_t>(n));
}

bool WorkArea::IsUsableDirectory(const std::string& dir) {
  struct stat st;
  if (dir.empty() || stat(dir.c_str(), &st) != 0) return false;
  if (!S_ISDIR(st.st_mode)) return false;
  return access(dir.c_str(), W_OK | X_OK) == 0;
}

bool WorkArea::IsWithin(const std::string& path, const std::string& root) {
  if (path.empty() || root.empty()) return false;
  auto resolve = [](const std::string& p, fs::path* out) {
    std::error_code ec;
    const fs::path absolute = fs::absolute(p, ec);
    if (ec) return false;
    *out = fs::weakly_canonical(absolute, ec);
    return !ec;
  };
  fs::path resolved_root;
  fs::path resolved;
  if (!resolve(root, &resolved_root) || !resolve(path, &resolved)) return false;

  auto r = resolved_root.begin();
  auto p = resolved.begin();
  for (; r != resolved_root.end(); ++r, ++p) {
    // A trailing separator on the root shows up as an empty last element.
    if (r->empty()) break;
    if (p == resolved.end() || *p != *r) return false;
  }
  return true;
}

std::optional<WorkArea> WorkArea::Create(const std::string& root,
                                         const std::string& prefix,
                                         const std::string& run_id,
                                         std::string* error) {
  if (!IsUsableDirectory(root)) {
    if (error != nullptr) *error = "work root '" + root + "' is not a writable directory";
    return std::nullopt;
  }

  std::string pattern = root;
  if (pattern.back() != '/') pattern += '/';
  pattern += prefix + "_" + run_id + "_XXXXXX";

  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    if (error != nullptr) {
      *error = "mkdtemp(" + pattern + ") failed: " + std::strerror(errno);
    }
    return std::nullopt;
  }
  return WorkArea(std::string(buf.data()), run_id);
}

std::string WorkArea::StagePath(int stage, const std::string& extension) const {
  return dir_ + "/stage" + std::to_string(stage) + "." + extension;
}

std::string WorkArea::FinalPath(const std::string& extension) const {
  return dir_ + "/rtmix_final_" + run_id_ + "." + extension;
}

std::string WorkArea::WriteFile(const std::string& name, const std::string& bytes,
                                std::string* error) const {
  const std::string path = dir_ + "/" + name;
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    if (error != nullptr) *error = "cannot open " + path + " for writing";
    return "";
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.flush();
  if (!out) {
    if (error != nullptr) *error = "short write to " + path;
    out.close();
    (void)unlink(path.c_str());
    return "";
  }
  out.close();
  return path;
}

bool WorkArea::RemoveAll(std::string* error) const {
  std::error_code ec;
  fs::remove_all(dir_, ec);
  if (ec) {
    if (error != nullptr) *error = "remove_all(" + dir_ + "): " + ec.message();
    return false;
  }
  return true;
}

bool WorkArea::Promote(const std::string& from, const std::string& to, std::string* error) {
  if (rename(from.c_str(), to.c_str()) == 0) return true;
  if (errno != EXDEV) {
    if (error != nullptr) {
      *error = "rename(" + from + ", " + to + "): " + std::strerror(errno);
    }
    return false;
  }

  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    if (error != nullptr) *error = "copy(" + from + ", " + to + "): " + ec.message();
    fs::remove(to, ec);
    return false;
  }
  fs::remove(from, ec);
  return true;
}

bool WorkArea::RemoveFile(const std::string& path, std::string* error) {
  if (unlink(path.c_str()) == 0 || errno == ENOENT) return true;
  if (error != nullptr) *error = "unlink(" + path + "): " + std::strerror(errno);
  return false;
}

}  // namespace rtmix::pipeline

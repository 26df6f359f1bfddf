// Repository: RTMix
// Component: Work Area
// Purpose: Per-run scratch directory, run ids, artifact promotion and cleanup.
// Copyright (c) 2025 RetroVue

#ifndef RTMIX_PIPELINE_WORK_AREA_HPP_
#define RTMIX_PIPELINE_WORK_AREA_HPP_

#include <optional>
#include <string>

namespace rtmix::pipeline {

// WorkArea owns one directory, <root>/<prefix>_<run_id>_XXXXXX, created with
// mkdtemp() so concurrent runs never share a path. It does not delete
// anything on destruction: the final artifact may live inside it and outlive
// the run. Callers clean up explicitly with RemoveAll().
class WorkArea {
 public:
  // "<yyyymmddThhmmssZ>-<counter>-<8 hex>". Unique within the process and
  // very unlikely to repeat across processes.
  static std::string NewRunId();

  // Creates the directory. Returns empty optional and fills *error when the
  // root is missing or not writable.
  static std::optional<WorkArea> Create(const std::string& root,
                                        const std::string& prefix,
                                        const std::string& run_id,
                                        std::string* error);

  // True when `dir` exists, is a directory and is writable.
  static bool IsUsableDirectory(const std::string& dir);

  // True when `path` names `root` or something beneath it once both are made
  // absolute and "..", "." and existing symlinks are resolved. The path need
  // not exist yet. Empty arguments are never within.
  static bool IsWithin(const std::string& path, const std::string& root);

  const std::string& dir() const { return dir_; }
  const std::string& run_id() const { return run_id_; }

  // <dir>/stage<N>.<ext>
  std::string StagePath(int stage, const std::string& extension) const;

  // <dir>/rtmix_final_<run_id>.<ext>
  std::string FinalPath(const std::string& extension) const;

  // Writes `bytes` to <dir>/<name>. Returns the path, or empty string and
  // fills *error.
  std::string WriteFile(const std::string& name, const std::string& bytes,
                        std::string* error) const;

  // Removes the directory and everything under it.
  bool RemoveAll(std::string* error) const;

  // Moves `from` to `to`: rename(), or copy + unlink when the two paths are
  // on different filesystems. The data is never re-encoded.
  static bool Promote(const std::string& from, const std::string& to, std::string* error);

  // unlink(); a missing file is not an error.
  static bool RemoveFile(const std::string& path, std::string* error);

 private:
  WorkArea(std::string dir, std::string run_id);

  std::string dir_;
  std::string run_id_;
};

}  // namespace rtmix::pipeline

#endif  // RTMIX_PIPELINE_WORK_AREA_HPP_

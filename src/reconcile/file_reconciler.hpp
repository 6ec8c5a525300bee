#pragma once

#include "core/logging/logger.hpp"
#include "model/project.hpp"
#include "reconcile/path_probe.hpp"
#include "reconcile/probe_worker_pool.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace scenevault::reconcile {

inline constexpr std::chrono::milliseconds kDefaultProbeTimeout{250};
inline constexpr std::size_t kDefaultMaxProbeWorkers = 4U;

struct ReconcilerOptions {
  // Relative recorded paths are probed under this root when it is set. The
  // report always carries paths as recorded.
  std::filesystem::path artifact_root;
  // One deadline for all paths of a Reconcile call. Zero probes inline on
  // the calling thread without a bound.
  std::chrono::milliseconds probe_timeout = kDefaultProbeTimeout;
  // Upper bound on probe threads, including ones stuck on a hung mount.
  std::size_t max_probe_workers = kDefaultMaxProbeWorkers;
};

struct ReconcileReport {
  // True only when nothing is missing and the project has a latest checkpoint.
  bool files_exist = false;
  // Expected paths in collection order.
  std::vector<std::string> expected_files;
  std::vector<std::string> missing_files;
};

// Expected artifact set: audio then image path of every completed scene (in
// scene order), then the latest checkpoint output path. Empty paths are
// skipped and duplicates keep their first position.
std::vector<std::string> CollectExpectedPaths(const model::Project& project);

// Compares recorded artifact paths against storage. Results are never cached;
// every call probes again.
class FileReconciler {
public:
  FileReconciler(ReconcilerOptions options, std::shared_ptr<IPathProbe> probe,
                 core::logging::Logger& logger);

  ReconcileReport Reconcile(const model::Project& project) const;

  const ReconcilerOptions& Options() const {
    return options_;
  }

  std::size_t LiveProbeWorkers() const;

private:
  std::filesystem::path ResolveProbePath(const std::string& recorded_path) const;
  std::vector<ProbeResult> ProbePaths(const std::vector<std::filesystem::path>& paths) const;

  ReconcilerOptions options_;
  std::shared_ptr<IPathProbe> probe_;
  std::unique_ptr<ProbeWorkerPool> pool_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace scenevault::reconcile

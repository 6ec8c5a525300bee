#include "reconcile/file_reconciler.hpp"

#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace scenevault::reconcile {

namespace {

std::string DescribeMiss(const ProbeResult& result, const std::chrono::milliseconds timeout) {
  switch (result.status) {
  case ProbeStatus::kExists:
    return {};
  case ProbeStatus::kMissing:
    return "not a regular file";
  case ProbeStatus::kFailed:
    return result.error;
  case ProbeStatus::kTimedOut:
    return "probe timed out after " + std::to_string(timeout.count()) + "ms";
  }
  return result.error;
}

void AppendUnique(const std::optional<std::string>& path, std::set<std::string>& seen,
                  std::vector<std::string>& out) {
  if (!path.has_value() || path->empty()) {
    return;
  }
  if (seen.insert(*path).second) {
    out.push_back(*path);
  }
}

} // namespace

std::vector<std::string> CollectExpectedPaths(const model::Project& project) {
  std::vector<std::string> paths;
  std::set<std::string> seen;
  for (const model::Scene& scene : project.scenes) {
    if (!scene.is_completed) {
      continue;
    }
    AppendUnique(scene.audio_file_path, seen, paths);
    AppendUnique(scene.image_file_path, seen, paths);
  }
  if (const model::Checkpoint* latest = project.LatestCheckpoint(); latest != nullptr) {
    AppendUnique(latest->output_file_path, seen, paths);
  }
  return paths;
}

FileReconciler::FileReconciler(ReconcilerOptions options, std::shared_ptr<IPathProbe> probe,
                               core::logging::Logger& logger)
    : options_(std::move(options)), probe_(std::move(probe)), logger_(&logger) {
  if (probe_ == nullptr) {
    probe_ = std::make_shared<FilesystemPathProbe>();
  }
  pool_ = std::make_unique<ProbeWorkerPool>(probe_, options_.max_probe_workers);
}

std::size_t FileReconciler::LiveProbeWorkers() const {
  return pool_->LiveWorkers();
}

fs::path FileReconciler::ResolveProbePath(const std::string& recorded_path) const {
  const fs::path recorded(recorded_path);
  if (recorded.is_relative() && !options_.artifact_root.empty()) {
    return options_.artifact_root / recorded;
  }
  return recorded;
}

std::vector<ProbeResult> FileReconciler::ProbePaths(const std::vector<fs::path>& paths) const {
  if (options_.probe_timeout > std::chrono::milliseconds::zero()) {
    return pool_->ProbeAll(paths, options_.probe_timeout);
  }

  std::vector<ProbeResult> results(paths.size());
  for (std::size_t i = 0; i < paths.size(); ++i) {
    bool exists = false;
    if (!probe_->Probe(paths[i], exists, results[i].error)) {
      results[i].status = ProbeStatus::kFailed;
      continue;
    }
    results[i].status = exists ? ProbeStatus::kExists : ProbeStatus::kMissing;
  }
  return results;
}

ReconcileReport FileReconciler::Reconcile(const model::Project& project) const {
  ReconcileReport report;
  report.expected_files = CollectExpectedPaths(project);

  std::vector<fs::path> probe_paths;
  probe_paths.reserve(report.expected_files.size());
  for (const std::string& path : report.expected_files) {
    probe_paths.push_back(ResolveProbePath(path));
  }

  const std::vector<ProbeResult> results = ProbePaths(probe_paths);
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (results[i].status == ProbeStatus::kExists) {
      continue;
    }
    const std::string& path = report.expected_files[i];
    report.missing_files.push_back(path);
    logger_->Debug("artifact missing",
                   {{"project_id", project.project_id},
                    {"path", path},
                    {"reason", DescribeMiss(results[i], options_.probe_timeout)}});
  }

  report.files_exist = report.missing_files.empty() && project.LatestCheckpoint() != nullptr;
  return report;
}

} // namespace scenevault::reconcile

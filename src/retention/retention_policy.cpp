#include "retention/retention_policy.hpp"

#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"

#include <sstream>

namespace scenevault::retention {

using core::errors::ErrorKind;
using core::errors::OperationError;

namespace {

std::string IdArrayJson(const std::vector<std::string>& ids) {
  std::string out = "[";
  for (std::size_t i = 0; i < ids.size(); ++i) {
    out += i == 0U ? "" : ",";
    out += core::QuoteJson(ids[i]);
  }
  out += "]";
  return out;
}

} // namespace

bool IsPurgeEligible(const model::Project& project, const RetentionPolicy& policy,
                     const std::chrono::system_clock::time_point now) {
  switch (project.status) {
  case model::ProjectStatus::kDone:
    if (!policy.include_done) {
      return false;
    }
    break;
  case model::ProjectStatus::kCancelled:
    if (!policy.include_cancelled) {
      return false;
    }
    break;
  case model::ProjectStatus::kCreated:
  case model::ProjectStatus::kInProgress:
    return false;
  }

  const auto terminal_at = project.completed_at.value_or(project.updated_at);
  return terminal_at < now - policy.max_age;
}

bool PurgeExpiredProjects(store::ICheckpointStore& store, const RetentionPolicy& policy,
                          const std::chrono::system_clock::time_point now,
                          core::logging::Logger& logger, PurgeReport& report,
                          OperationError& error) {
  report = PurgeReport{};
  error.Clear();

  std::vector<model::Project> projects;
  if (!store.List(projects, error)) {
    return false;
  }

  for (const model::Project& project : projects) {
    ++report.scanned;
    if (!IsPurgeEligible(project, policy, now)) {
      continue;
    }
    if (policy.dry_run) {
      report.purged_project_ids.push_back(project.project_id);
      continue;
    }

    OperationError delete_error;
    if (!store.Delete(project.project_id, delete_error)) {
      if (delete_error.Is(ErrorKind::kNotFound)) {
        // Deleted concurrently; the goal is already reached.
        continue;
      }
      report.failed_project_ids.push_back(project.project_id);
      report.failure_messages.push_back(core::errors::FormatOperationError(delete_error));
      logger.Warn("retention purge failed for project",
                  {{"project_id", project.project_id}, {"error", delete_error.message}});
      continue;
    }
    report.purged_project_ids.push_back(project.project_id);
    logger.Info("retention purged project", {{"project_id", project.project_id},
                                             {"status", model::ToString(project.status)}});
  }

  if (!report.failed_project_ids.empty()) {
    error.Set(ErrorKind::kStoreUnavailable,
              std::to_string(report.failed_project_ids.size()) + " project(s) failed to purge");
    return false;
  }
  return true;
}

std::string ToJson(const PurgeReport& report, const bool dry_run) {
  std::ostringstream out;
  out << "{\"dry_run\":" << (dry_run ? "true" : "false") << ",\"scanned\":" << report.scanned
      << ",\"purged\":" << IdArrayJson(report.purged_project_ids)
      << ",\"failed\":" << IdArrayJson(report.failed_project_ids) << "}\n";
  return out.str();
}

} // namespace scenevault::retention

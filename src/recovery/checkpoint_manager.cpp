#include "recovery/checkpoint_manager.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace scenevault::recovery {

namespace {

using core::errors::ErrorKind;
using core::errors::OperationError;

std::string MakeProjectId(const std::chrono::system_clock::time_point now) {
  std::random_device device;
  std::uniform_int_distribution<std::uint32_t> distribution;
  std::ostringstream out;
  out << "proj-" << core::ToEpochMilliseconds(now) << "-" << std::hex << std::setw(8)
      << std::setfill('0') << distribution(device);
  return out.str();
}

} // namespace

const char* ToString(const CancelOutcome outcome) {
  switch (outcome) {
  case CancelOutcome::kCancelled:
    return "cancelled";
  case CancelOutcome::kAlreadyTerminal:
    return "already_terminal";
  }
  return "cancelled";
}

CheckpointManager::CheckpointManager(store::ICheckpointStore& store,
                                     const reconcile::FileReconciler& reconciler,
                                     core::logging::Logger& logger, ManagerOptions options)
    : store_(&store), reconciler_(&reconciler), logger_(&logger), options_(std::move(options)) {}

std::chrono::system_clock::time_point CheckpointManager::Now() const {
  const auto now = options_.clock ? options_.clock() : std::chrono::system_clock::now();
  return core::TruncateToMilliseconds(now);
}

void CheckpointManager::LogStoreFailure(std::string_view operation, const std::string& project_id,
                                        const OperationError& error) const {
  if (!error.Is(ErrorKind::kStoreUnavailable)) {
    return;
  }
  logger_->Warn("checkpoint store unavailable",
                {{"operation", operation},
                 {"project_id", project_id},
                 {"code", core::errors::ToStableErrorCode(error.kind)},
                 {"error", error.message}});
}

bool CheckpointManager::CreateProject(const CreateProjectRequest& request,
                                      model::Project& created, OperationError& error) {
  error.Clear();
  const auto now = Now();

  model::Project project;
  project.project_id = request.project_id.empty() ? MakeProjectId(now) : request.project_id;
  project.title = request.title;
  project.description = request.description;
  project.job_id = request.job_id;
  project.created_at = now;
  project.updated_at = now;
  project.scenes = request.scenes;
  std::sort(project.scenes.begin(), project.scenes.end(),
            [](const model::Scene& lhs, const model::Scene& rhs) { return lhs.index < rhs.index; });

  std::string validation_error;
  if (!model::ValidateProject(project, options_.artifact_policy, validation_error)) {
    error.Set(ErrorKind::kInvalidArgument, validation_error);
    return false;
  }

  if (!store_->Insert(project, error)) {
    LogStoreFailure("create", project.project_id, error);
    return false;
  }

  logger_->Info("project created", {{"project_id", project.project_id},
                                    {"job_id", project.job_id},
                                    {"scene_count", std::to_string(project.scenes.size())}});
  created = std::move(project);
  return true;
}

bool CheckpointManager::RecordCheckpoint(const model::CheckpointWrite& write,
                                         model::Project& committed, OperationError& error) {
  error.Clear();
  ApplyOptions apply_options;
  apply_options.artifact_policy = options_.artifact_policy;
  apply_options.max_checkpoint_history = options_.max_checkpoint_history;
  apply_options.now = Now();

  const auto mutator = [&write, &apply_options](model::Project& project, OperationError& err) {
    return ApplyCheckpointWrite(project, write, apply_options, err);
  };

  if (!store_->Update(write.project_id, mutator, committed, error)) {
    const std::string_view code = core::errors::ToStableErrorCode(error.kind);
    if (error.Is(ErrorKind::kInvalidCheckpointOrder)) {
      logger_->Error("checkpoint rejected: out of order",
                     {{"project_id", write.project_id},
                      {"stage", model::ToString(write.stage)},
                      {"completed_scenes", std::to_string(write.completed_scenes)},
                      {"code", code},
                      {"error", error.message}});
    } else if (error.Is(ErrorKind::kStoreUnavailable)) {
      LogStoreFailure("checkpoint", write.project_id, error);
    } else {
      logger_->Info("checkpoint rejected",
                    {{"project_id", write.project_id}, {"code", code}, {"error", error.message}});
    }
    return false;
  }

  const model::Checkpoint* latest = committed.LatestCheckpoint();
  logger_->Info("checkpoint accepted",
                {{"project_id", committed.project_id},
                 {"sequence", latest != nullptr ? std::to_string(latest->sequence) : "0"},
                 {"stage", model::ToString(committed.current_stage)},
                 {"status", model::ToString(committed.status)},
                 {"completed_scenes", std::to_string(write.completed_scenes)},
                 {"total_scenes", std::to_string(write.total_scenes)},
                 {"progress_percent", std::to_string(committed.progress_percent)}});
  return true;
}

bool CheckpointManager::RecordFailure(const std::string& project_id, const std::string& message,
                                      model::Project& committed, OperationError& error) {
  error.Clear();
  if (message.empty()) {
    error.Set(ErrorKind::kInvalidArgument, "failure message cannot be empty");
    return false;
  }

  const auto now = Now();
  const auto mutator = [&message, now](model::Project& project, OperationError& err) {
    if (project.IsTerminal()) {
      err.Set(ErrorKind::kProjectTerminated,
              "project " + project.project_id + " is " + model::ToString(project.status));
      return false;
    }
    project.error_message = message;
    project.updated_at = std::max(project.updated_at, now);
    return true;
  };

  if (!store_->Update(project_id, mutator, committed, error)) {
    LogStoreFailure("fail", project_id, error);
    return false;
  }
  logger_->Warn("pipeline failure recorded", {{"project_id", project_id}, {"error", message}});
  return true;
}

bool CheckpointManager::ListIncompleteProjects(std::vector<RecoveryView>& views,
                                               OperationError& error) const {
  views.clear();
  error.Clear();

  std::vector<model::Project> projects;
  if (!store_->List(projects, error)) {
    LogStoreFailure("list", "", error);
    return false;
  }

  for (model::Project& project : projects) {
    if (project.IsTerminal()) {
      continue;
    }
    const reconcile::ReconcileReport report = reconciler_->Reconcile(project);
    views.push_back(BuildRecoveryView(std::move(project), report));
  }
  return true;
}

bool CheckpointManager::GetProjectForRecovery(const std::string& project_id, RecoveryView& view,
                                              OperationError& error) const {
  error.Clear();
  model::Project project;
  if (!store_->Get(project_id, project, error)) {
    LogStoreFailure("get", project_id, error);
    return false;
  }
  const reconcile::ReconcileReport report = reconciler_->Reconcile(project);
  view = BuildRecoveryView(std::move(project), report);
  return true;
}

bool CheckpointManager::CancelProject(const std::string& project_id, CancelOutcome& outcome,
                                      OperationError& error) {
  error.Clear();
  const auto now = Now();
  bool already_terminal = false;
  model::ProjectStatus previous_status = model::ProjectStatus::kCreated;

  const auto mutator = [&already_terminal, &previous_status, now](model::Project& project,
                                                                  OperationError& err) {
    previous_status = project.status;
    if (project.IsTerminal()) {
      already_terminal = true;
      err.Set(ErrorKind::kProjectTerminated, "project already terminal");
      return false;
    }
    project.status = model::ProjectStatus::kCancelled;
    project.updated_at = std::max(project.updated_at, now);
    project.completed_at = project.updated_at;
    return true;
  };

  model::Project committed;
  if (!store_->Update(project_id, mutator, committed, error)) {
    if (already_terminal) {
      error.Clear();
      outcome = CancelOutcome::kAlreadyTerminal;
      logger_->Info("cancel is a no-op for terminal project",
                    {{"project_id", project_id}, {"status", model::ToString(previous_status)}});
      return true;
    }
    LogStoreFailure("cancel", project_id, error);
    return false;
  }

  outcome = CancelOutcome::kCancelled;
  logger_->Info("project cancelled", {{"project_id", project_id},
                                      {"previous_status", model::ToString(previous_status)},
                                      {"stage", model::ToString(committed.current_stage)}});
  return true;
}

bool CheckpointManager::DiscardProject(const std::string& project_id, OperationError& error) {
  error.Clear();
  if (!store_->Delete(project_id, error)) {
    LogStoreFailure("discard", project_id, error);
    return false;
  }
  logger_->Info("project discarded", {{"project_id", project_id}});
  return true;
}

bool CheckpointManager::IsCancellationRequested(const std::string& project_id, bool& requested,
                                                OperationError& error) const {
  error.Clear();
  requested = false;
  model::Project project;
  if (!store_->Get(project_id, project, error)) {
    if (error.Is(ErrorKind::kNotFound)) {
      error.Clear();
      requested = true;
      return true;
    }
    LogStoreFailure("poll", project_id, error);
    return false;
  }
  requested = project.IsTerminal();
  return true;
}

} // namespace scenevault::recovery

#pragma once

#include "core/errors/operation_error.hpp"
#include "core/logging/logger.hpp"
#include "model/checkpoint_write.hpp"
#include "model/project.hpp"
#include "reconcile/file_reconciler.hpp"
#include "recovery/checkpoint_order.hpp"
#include "recovery/recovery_view.hpp"
#include "store/checkpoint_store.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace scenevault::recovery {

enum class CancelOutcome {
  kCancelled,
  // Project was already Done or Cancelled; nothing was written.
  kAlreadyTerminal,
};

const char* ToString(CancelOutcome outcome);

using Clock = std::function<std::chrono::system_clock::time_point()>;

struct ManagerOptions {
  model::ArtifactPolicy artifact_policy;
  std::size_t max_checkpoint_history = kDefaultMaxCheckpointHistory;
  // Defaults to system_clock::now when empty.
  Clock clock;
};

struct CreateProjectRequest {
  // Generated as `proj-<epoch_ms>-<hex>` when empty.
  std::string project_id;
  std::string title;
  std::string description;
  std::string job_id;
  // Optional initial scene plan (usually script text only).
  std::vector<model::Scene> scenes;
};

// Orchestration facade over the store and the reconciler. Holds no project
// state of its own; every read goes to the store and every view is
// reconciled fresh.
class CheckpointManager {
public:
  CheckpointManager(store::ICheckpointStore& store, const reconcile::FileReconciler& reconciler,
                    core::logging::Logger& logger, ManagerOptions options = {});

  // Starts tracking a new job. Duplicate ids are rejected with kInvalidArgument.
  bool CreateProject(const CreateProjectRequest& request, model::Project& created,
                     core::errors::OperationError& error);

  // Pipeline writer checkpoint call. See ApplyCheckpointWrite for the
  // validation order. A rejected write leaves the stored record untouched.
  bool RecordCheckpoint(const model::CheckpointWrite& write, model::Project& committed,
                        core::errors::OperationError& error);

  // Stores the writer's last failure text without changing stage or status.
  bool RecordFailure(const std::string& project_id, const std::string& message,
                     model::Project& committed, core::errors::OperationError& error);

  // Non-terminal projects ordered by project id, each with a fresh reconciliation.
  bool ListIncompleteProjects(std::vector<RecoveryView>& views,
                              core::errors::OperationError& error) const;

  bool GetProjectForRecovery(const std::string& project_id, RecoveryView& view,
                             core::errors::OperationError& error) const;

  // Logical, idempotent cancel. Persisted data and artifacts are kept.
  // Fails only with kNotFound (never existed) or store trouble.
  bool CancelProject(const std::string& project_id, CancelOutcome& outcome,
                     core::errors::OperationError& error);

  // Storage reclamation. Independent of cancellation.
  bool DiscardProject(const std::string& project_id, core::errors::OperationError& error);

  // Writer poll: true once the project is terminal or no longer stored.
  bool IsCancellationRequested(const std::string& project_id, bool& requested,
                               core::errors::OperationError& error) const;

private:
  std::chrono::system_clock::time_point Now() const;
  void LogStoreFailure(std::string_view operation, const std::string& project_id,
                       const core::errors::OperationError& error) const;

  store::ICheckpointStore* store_ = nullptr;
  const reconcile::FileReconciler* reconciler_ = nullptr;
  core::logging::Logger* logger_ = nullptr;
  ManagerOptions options_;
};

} // namespace scenevault::recovery

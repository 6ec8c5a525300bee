#pragma once

#include "model/project.hpp"
#include "reconcile/file_reconciler.hpp"

#include <optional>
#include <string>
#include <vector>

namespace scenevault::recovery {

// Read-time projection of one project plus a fresh reconciliation. Built on
// every read and never stored.
struct RecoveryView {
  model::Project project;
  std::optional<model::Checkpoint> latest_checkpoint;
  bool files_exist = false;
  std::vector<std::string> missing_files;
  bool can_recover = false;
};

// The only place that decides whether a project is safely resumable.
bool ComputeCanRecover(const model::Project& project, const reconcile::ReconcileReport& report);

RecoveryView BuildRecoveryView(model::Project project, const reconcile::ReconcileReport& report);

// Compact form used by the incomplete-project listing.
std::string ToSummaryJson(const RecoveryView& view);
std::string ToSummaryListJson(const std::vector<RecoveryView>& views);

// Full form with per-scene breakdown and the latest checkpoint.
std::string ToDetailJson(const RecoveryView& view);

} // namespace scenevault::recovery

#pragma once

#include "core/errors/operation_error.hpp"
#include "store/checkpoint_store.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace scenevault::core::logging {
class Logger;
}

namespace scenevault::retention {

inline constexpr std::uint32_t kDefaultMaxAgeDays = 30U;

// Which terminal projects an explicit purge may reclaim. Projects that are
// still Created or InProgress are never purged.
struct RetentionPolicy {
  std::chrono::hours max_age{24 * kDefaultMaxAgeDays};
  bool include_done = true;
  bool include_cancelled = true;
  bool dry_run = false;
};

struct PurgeReport {
  std::uint64_t scanned = 0;
  std::vector<std::string> purged_project_ids;
  // Eligible ids that failed to delete, with the error that stopped them.
  std::vector<std::string> failed_project_ids;
  std::vector<std::string> failure_messages;
};

// True when `project` is terminal, enabled by the policy, and its terminal
// timestamp (CompletedAt, else UpdatedAt) is older than `now - max_age`.
bool IsPurgeEligible(const model::Project& project, const RetentionPolicy& policy,
                     std::chrono::system_clock::time_point now);

// Deletes every eligible project (or only reports them when dry_run is set).
// A failed delete is recorded in the report and the sweep continues; the call
// fails only when the store cannot be listed or any delete failed.
bool PurgeExpiredProjects(store::ICheckpointStore& store, const RetentionPolicy& policy,
                          std::chrono::system_clock::time_point now,
                          core::logging::Logger& logger, PurgeReport& report,
                          core::errors::OperationError& error);

std::string ToJson(const PurgeReport& report, bool dry_run);

} // namespace scenevault::retention

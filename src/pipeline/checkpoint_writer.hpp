#pragma once

#include "core/errors/operation_error.hpp"
#include "model/checkpoint_write.hpp"
#include "model/project.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace scenevault::core::logging {
class Logger;
}

namespace scenevault::recovery {
class CheckpointManager;
}

namespace scenevault::pipeline {

// Default budget for transient store failures on one checkpoint write.
constexpr std::uint32_t kDefaultWriteMaxAttempts = 4U;

struct RetryPolicy {
  std::uint32_t max_attempts = kDefaultWriteMaxAttempts;
  std::chrono::milliseconds initial_backoff{50};
  double multiplier = 2.0;
  std::chrono::milliseconds max_backoff{1000};
};

// Backoff before retry number `retry_index` (0-based), capped by max_backoff.
std::chrono::milliseconds ComputeBackoff(const RetryPolicy& policy, std::uint32_t retry_index);

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Writer-side client owned by one generation job. Retries kStoreUnavailable
// with exponential backoff and treats kProjectTerminated as a hard stop:
// after it, Write never reaches the manager again.
class ProjectCheckpointWriter {
public:
  ProjectCheckpointWriter(recovery::CheckpointManager& manager, std::string project_id,
                          RetryPolicy policy, core::logging::Logger& logger,
                          Sleeper sleeper = {});

  // `write.project_id` is overwritten with the writer's project id.
  bool Write(model::CheckpointWrite write, model::Project& committed,
             core::errors::OperationError& error);

  // True once stopped by a rejected write or when the manager reports the
  // project as cancelled, completed or discarded.
  bool ShouldStop();

  bool IsStopped() const {
    return stopped_;
  }

  std::uint32_t AttemptsUsedTotal() const {
    return attempts_used_total_;
  }

  const std::string& ProjectId() const {
    return project_id_;
  }

private:
  void Sleep(std::chrono::milliseconds delay) const;

  recovery::CheckpointManager* manager_ = nullptr;
  std::string project_id_;
  RetryPolicy policy_;
  core::logging::Logger* logger_ = nullptr;
  Sleeper sleeper_;
  bool stopped_ = false;
  std::uint32_t attempts_used_total_ = 0;
};

} // namespace scenevault::pipeline

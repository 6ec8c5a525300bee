#include "pipeline/checkpoint_writer.hpp"

#include "core/logging/logger.hpp"
#include "recovery/checkpoint_manager.hpp"

#include <algorithm>
#include <cmath>
#include <thread>
#include <utility>

namespace scenevault::pipeline {

using core::errors::ErrorKind;
using core::errors::OperationError;

std::chrono::milliseconds ComputeBackoff(const RetryPolicy& policy,
                                         const std::uint32_t retry_index) {
  const double base = static_cast<double>(policy.initial_backoff.count());
  const double factor = std::pow(std::max(policy.multiplier, 1.0), retry_index);
  const double cap = static_cast<double>(policy.max_backoff.count());
  const double delay = std::min(base * factor, cap);
  if (!std::isfinite(delay) || delay <= 0.0) {
    return std::chrono::milliseconds::zero();
  }
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(delay));
}

ProjectCheckpointWriter::ProjectCheckpointWriter(recovery::CheckpointManager& manager,
                                                 std::string project_id, RetryPolicy policy,
                                                 core::logging::Logger& logger, Sleeper sleeper)
    : manager_(&manager), project_id_(std::move(project_id)), policy_(policy), logger_(&logger),
      sleeper_(std::move(sleeper)) {}

void ProjectCheckpointWriter::Sleep(const std::chrono::milliseconds delay) const {
  if (delay <= std::chrono::milliseconds::zero()) {
    return;
  }
  if (sleeper_) {
    sleeper_(delay);
    return;
  }
  std::this_thread::sleep_for(delay);
}

bool ProjectCheckpointWriter::Write(model::CheckpointWrite write, model::Project& committed,
                                    OperationError& error) {
  error.Clear();
  if (stopped_) {
    error.Set(ErrorKind::kProjectTerminated,
              "writer for project " + project_id_ + " is stopped; checkpoint not sent");
    return false;
  }
  write.project_id = project_id_;

  const std::uint32_t max_attempts = std::max<std::uint32_t>(policy_.max_attempts, 1U);
  for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
    ++attempts_used_total_;
    if (manager_->RecordCheckpoint(write, committed, error)) {
      return true;
    }

    if (error.Is(ErrorKind::kProjectTerminated) || error.Is(ErrorKind::kNotFound)) {
      stopped_ = true;
      logger_->Info("checkpoint writer stopped",
                    {{"project_id", project_id_},
                     {"code", core::errors::ToStableErrorCode(error.kind)},
                     {"error", error.message}});
      return false;
    }
    if (!error.Is(ErrorKind::kStoreUnavailable)) {
      return false;
    }
    if (attempt == max_attempts) {
      break;
    }

    const std::chrono::milliseconds delay = ComputeBackoff(policy_, attempt - 1U);
    logger_->Warn("checkpoint write retry scheduled",
                  {{"project_id", project_id_},
                   {"attempt", std::to_string(attempt)},
                   {"max_attempts", std::to_string(max_attempts)},
                   {"backoff_ms", std::to_string(delay.count())},
                   {"error", error.message}});
    Sleep(delay);
  }

  logger_->Error("checkpoint write attempts exhausted",
                 {{"project_id", project_id_},
                  {"max_attempts", std::to_string(max_attempts)},
                  {"error", error.message}});
  return false;
}

bool ProjectCheckpointWriter::ShouldStop() {
  if (stopped_) {
    return true;
  }
  bool requested = false;
  OperationError error;
  if (!manager_->IsCancellationRequested(project_id_, requested, error)) {
    // Store trouble is not a stop signal; the next Write retries it.
    logger_->Debug("cancellation poll failed",
                   {{"project_id", project_id_}, {"error", error.message}});
    return false;
  }
  if (requested) {
    stopped_ = true;
  }
  return stopped_;
}

} // namespace scenevault::pipeline

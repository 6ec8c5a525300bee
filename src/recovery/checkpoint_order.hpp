#pragma once

#include "core/errors/operation_error.hpp"
#include "model/checkpoint_write.hpp"
#include "model/project.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace scenevault::recovery {

inline constexpr std::size_t kDefaultMaxCheckpointHistory = 50U;

struct ApplyOptions {
  model::ArtifactPolicy artifact_policy;
  // Oldest checkpoints beyond this count are dropped from the record.
  std::size_t max_checkpoint_history = kDefaultMaxCheckpointHistory;
  std::chrono::system_clock::time_point now{};
};

// Progress implied by stage position plus scene completion within the stage.
// Stage bands: script 0-10, audio 10-40, images 40-70, render 70-95, done 100.
std::uint32_t DeriveProgressPercent(model::PipelineStage stage, std::uint32_t completed_scenes,
                                    std::uint32_t total_scenes);

// Applies one checkpoint write to `project` in place. Checks run in this
// order and the first failure wins:
//   1) project terminal                       -> kProjectTerminated
//   2) malformed counts/indexes/progress, or
//      total_scenes below a stored scene index -> kInvalidArgument
//   3) regression vs the latest checkpoint    -> kInvalidCheckpointOrder
//   4) merged scenes violate artifact policy  -> kInvalidArgument
// On failure `project` may be partially modified; callers discard it.
bool ApplyCheckpointWrite(model::Project& project, const model::CheckpointWrite& write,
                          const ApplyOptions& options, core::errors::OperationError& error);

} // namespace scenevault::recovery

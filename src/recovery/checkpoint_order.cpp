#include "recovery/checkpoint_order.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <utility>

namespace scenevault::recovery {

namespace {

using core::errors::ErrorKind;
using core::errors::OperationError;

struct StageBand {
  std::uint32_t start = 0;
  std::uint32_t span = 0;
};

constexpr std::array<StageBand, 5> kStageBands = {{
    {0U, 10U},   // script
    {10U, 30U},  // audio
    {40U, 30U},  // images
    {70U, 25U},  // render
    {100U, 0U},  // done
}};

bool CheckWriteShape(const model::CheckpointWrite& write, OperationError& error) {
  if (write.completed_scenes > write.total_scenes) {
    error.Set(ErrorKind::kInvalidArgument,
              "completed_scenes (" + std::to_string(write.completed_scenes) +
                  ") exceeds total_scenes (" + std::to_string(write.total_scenes) + ")");
    return false;
  }
  if (write.progress_percent.has_value() && *write.progress_percent > 100U) {
    error.Set(ErrorKind::kInvalidArgument, "progress_percent must be within 0..100");
    return false;
  }
  for (const model::SceneUpdate& update : write.scene_updates) {
    if (update.index >= write.total_scenes) {
      error.Set(ErrorKind::kInvalidArgument,
                "scene index " + std::to_string(update.index) + " is outside total_scenes (" +
                    std::to_string(write.total_scenes) + ")");
      return false;
    }
  }
  return true;
}

// Scenes are kept sorted by index, so the last one bounds total_scenes.
bool CheckSceneCoverage(const model::Project& project, const model::CheckpointWrite& write,
                        OperationError& error) {
  if (project.scenes.empty()) {
    return true;
  }
  const std::uint32_t highest_index = project.scenes.back().index;
  if (static_cast<std::uint64_t>(write.total_scenes) <= highest_index) {
    error.Set(ErrorKind::kInvalidArgument,
              "total_scenes (" + std::to_string(write.total_scenes) +
                  ") does not cover stored scene index " + std::to_string(highest_index));
    return false;
  }
  return true;
}

bool CheckOrder(const model::Project& project, const model::CheckpointWrite& write,
                OperationError& error) {
  const model::PipelineStage reference_stage =
      project.LatestCheckpoint() != nullptr ? project.LatestCheckpoint()->stage
                                            : project.current_stage;
  if (model::IsEarlierStage(write.stage, reference_stage)) {
    error.Set(ErrorKind::kInvalidCheckpointOrder,
              std::string("stage '") + model::ToString(write.stage) + "' is earlier than '" +
                  model::ToString(reference_stage) + "'");
    return false;
  }

  const model::Checkpoint* latest = project.LatestCheckpoint();
  if (latest != nullptr && write.stage == latest->stage &&
      write.completed_scenes < latest->completed_scenes) {
    error.Set(ErrorKind::kInvalidCheckpointOrder,
              "completed_scenes regressed from " + std::to_string(latest->completed_scenes) +
                  " to " + std::to_string(write.completed_scenes) + " within stage '" +
                  model::ToString(write.stage) + "'");
    return false;
  }

  if (write.progress_percent.has_value() && *write.progress_percent < project.progress_percent) {
    error.Set(ErrorKind::kInvalidCheckpointOrder,
              "progress_percent regressed from " + std::to_string(project.progress_percent) +
                  " to " + std::to_string(*write.progress_percent));
    return false;
  }
  return true;
}

void MergeSceneUpdate(model::Project& project, const model::SceneUpdate& update) {
  model::Scene* scene = project.FindScene(update.index);
  if (scene == nullptr) {
    const auto position = std::lower_bound(
        project.scenes.begin(), project.scenes.end(), update.index,
        [](const model::Scene& existing, std::uint32_t index) { return existing.index < index; });
    model::Scene created;
    created.index = update.index;
    scene = &*project.scenes.insert(position, created);
  }

  if (update.script_text.has_value()) {
    scene->script_text = *update.script_text;
  }
  if (update.duration_seconds.has_value()) {
    scene->duration_seconds = *update.duration_seconds;
  }
  if (update.is_completed.has_value()) {
    scene->is_completed = *update.is_completed;
  }
  if (update.audio_file_path.has_value()) {
    scene->audio_file_path = update.audio_file_path;
  }
  if (update.image_file_path.has_value()) {
    scene->image_file_path = update.image_file_path;
  }
}

} // namespace

std::uint32_t DeriveProgressPercent(const model::PipelineStage stage,
                                    const std::uint32_t completed_scenes,
                                    const std::uint32_t total_scenes) {
  const StageBand& band = kStageBands[static_cast<std::size_t>(stage)];
  if (total_scenes == 0U || band.span == 0U) {
    return band.start;
  }
  const std::uint64_t clamped = std::min(completed_scenes, total_scenes);
  return band.start + static_cast<std::uint32_t>((band.span * clamped) / total_scenes);
}

bool ApplyCheckpointWrite(model::Project& project, const model::CheckpointWrite& write,
                          const ApplyOptions& options, OperationError& error) {
  if (project.IsTerminal()) {
    error.Set(ErrorKind::kProjectTerminated, "project " + project.project_id + " is " +
                                                 model::ToString(project.status) +
                                                 "; no further checkpoints are accepted");
    return false;
  }
  if (!CheckWriteShape(write, error) || !CheckSceneCoverage(project, write, error) ||
      !CheckOrder(project, write, error)) {
    return false;
  }

  for (const model::SceneUpdate& update : write.scene_updates) {
    MergeSceneUpdate(project, update);
  }
  std::string policy_error;
  if (!model::ValidateProject(project, options.artifact_policy, policy_error)) {
    error.Set(ErrorKind::kInvalidArgument, policy_error);
    return false;
  }

  const model::Checkpoint* latest = project.LatestCheckpoint();
  model::Checkpoint checkpoint;
  checkpoint.sequence = latest != nullptr ? latest->sequence + 1U : 1U;
  checkpoint.stage = write.stage;
  checkpoint.checkpoint_time = core::TruncateToMilliseconds(options.now);
  if (latest != nullptr && checkpoint.checkpoint_time <= latest->checkpoint_time) {
    checkpoint.checkpoint_time = latest->checkpoint_time + std::chrono::milliseconds(1);
  }
  checkpoint.completed_scenes = write.completed_scenes;
  checkpoint.total_scenes = write.total_scenes;
  checkpoint.output_file_path = write.output_file_path;
  checkpoint.checkpoint_data = write.checkpoint_data;
  checkpoint.is_valid = true;

  std::uint32_t progress = write.progress_percent.value_or(
      DeriveProgressPercent(write.stage, write.completed_scenes, write.total_scenes));
  if (write.stage == model::PipelineStage::kDone) {
    progress = 100U;
  }
  project.progress_percent = std::max(project.progress_percent, progress);

  project.current_stage = write.stage;
  if (write.stage == model::PipelineStage::kDone) {
    project.status = model::ProjectStatus::kDone;
    project.completed_at = checkpoint.checkpoint_time;
  } else {
    project.status = model::ProjectStatus::kInProgress;
  }
  project.updated_at = std::max(project.updated_at, checkpoint.checkpoint_time);
  project.checkpoints.push_back(std::move(checkpoint));

  const std::size_t history_limit = std::max<std::size_t>(options.max_checkpoint_history, 1U);
  if (project.checkpoints.size() > history_limit) {
    const auto excess = static_cast<std::ptrdiff_t>(project.checkpoints.size() - history_limit);
    project.checkpoints.erase(project.checkpoints.begin(), project.checkpoints.begin() + excess);
  }
  return true;
}

} // namespace scenevault::recovery

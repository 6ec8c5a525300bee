#include "model/project.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace scenevault::model {

namespace {

constexpr std::size_t kMaxProjectIdLength = 128U;

bool IsPathSet(const std::optional<std::string>& path) {
  return path.has_value() && !path->empty();
}

bool ValidateScenes(const std::vector<Scene>& scenes, const ArtifactPolicy& policy,
                    std::string& error) {
  for (std::size_t i = 0; i < scenes.size(); ++i) {
    const Scene& scene = scenes[i];
    const std::string label = "scene " + std::to_string(scene.index);
    if (i > 0U && scenes[i - 1U].index >= scene.index) {
      error = "scenes must be ordered by unique index (" + label + ")";
      return false;
    }
    if (!std::isfinite(scene.duration_seconds) || scene.duration_seconds < 0.0) {
      error = label + " has an invalid duration";
      return false;
    }
    if (!scene.is_completed) {
      continue;
    }
    if (scene.duration_seconds <= 0.0) {
      error = label + " is completed but has no positive duration";
      return false;
    }
    if (policy.require_audio && !IsPathSet(scene.audio_file_path)) {
      error = label + " is completed but has no audio file path";
      return false;
    }
    if (policy.require_image && !IsPathSet(scene.image_file_path)) {
      error = label + " is completed but has no image file path";
      return false;
    }
  }
  return true;
}

bool ValidateCheckpoints(const std::vector<Checkpoint>& checkpoints, std::string& error) {
  for (std::size_t i = 0; i < checkpoints.size(); ++i) {
    const Checkpoint& checkpoint = checkpoints[i];
    const std::string label = "checkpoint " + std::to_string(checkpoint.sequence);
    if (!core::IsWholeMilliseconds(checkpoint.checkpoint_time)) {
      error = label + " checkpoint_time has sub-millisecond precision";
      return false;
    }
    if (checkpoint.completed_scenes > checkpoint.total_scenes) {
      error = label + " has completed_scenes greater than total_scenes";
      return false;
    }
    if (i == 0U) {
      continue;
    }
    const Checkpoint& previous = checkpoints[i - 1U];
    if (checkpoint.sequence <= previous.sequence) {
      error = label + " sequence does not increase";
      return false;
    }
    if (checkpoint.checkpoint_time <= previous.checkpoint_time) {
      error = label + " checkpoint_time does not increase";
      return false;
    }
    if (IsEarlierStage(checkpoint.stage, previous.stage)) {
      error = label + " regresses the pipeline stage";
      return false;
    }
  }
  return true;
}

} // namespace

const char* ToString(const PipelineStage stage) {
  switch (stage) {
  case PipelineStage::kScript:
    return "script";
  case PipelineStage::kAudio:
    return "audio";
  case PipelineStage::kImages:
    return "images";
  case PipelineStage::kRender:
    return "render";
  case PipelineStage::kDone:
    return "done";
  }
  return "script";
}

bool ParsePipelineStage(std::string_view text, PipelineStage& stage) {
  if (text == "script") {
    stage = PipelineStage::kScript;
    return true;
  }
  if (text == "audio") {
    stage = PipelineStage::kAudio;
    return true;
  }
  if (text == "images") {
    stage = PipelineStage::kImages;
    return true;
  }
  if (text == "render") {
    stage = PipelineStage::kRender;
    return true;
  }
  if (text == "done") {
    stage = PipelineStage::kDone;
    return true;
  }
  return false;
}

const char* ToString(const ProjectStatus status) {
  switch (status) {
  case ProjectStatus::kCreated:
    return "created";
  case ProjectStatus::kInProgress:
    return "in_progress";
  case ProjectStatus::kDone:
    return "done";
  case ProjectStatus::kCancelled:
    return "cancelled";
  }
  return "created";
}

bool ParseProjectStatus(std::string_view text, ProjectStatus& status) {
  if (text == "created") {
    status = ProjectStatus::kCreated;
    return true;
  }
  if (text == "in_progress") {
    status = ProjectStatus::kInProgress;
    return true;
  }
  if (text == "done") {
    status = ProjectStatus::kDone;
    return true;
  }
  if (text == "cancelled") {
    status = ProjectStatus::kCancelled;
    return true;
  }
  return false;
}

bool IsEarlierStage(const PipelineStage candidate, const PipelineStage reference) {
  return static_cast<int>(candidate) < static_cast<int>(reference);
}

bool IsTerminal(const ProjectStatus status) {
  return status == ProjectStatus::kDone || status == ProjectStatus::kCancelled;
}

const Checkpoint* Project::LatestCheckpoint() const {
  if (checkpoints.empty()) {
    return nullptr;
  }
  return &checkpoints.back();
}

bool Project::IsTerminal() const {
  return model::IsTerminal(status);
}

const Scene* Project::FindScene(const std::uint32_t index) const {
  const auto it = std::find_if(scenes.begin(), scenes.end(),
                               [index](const Scene& scene) { return scene.index == index; });
  return it == scenes.end() ? nullptr : &*it;
}

Scene* Project::FindScene(const std::uint32_t index) {
  const auto it = std::find_if(scenes.begin(), scenes.end(),
                               [index](const Scene& scene) { return scene.index == index; });
  return it == scenes.end() ? nullptr : &*it;
}

std::uint32_t Project::CompletedSceneCount() const {
  return static_cast<std::uint32_t>(std::count_if(
      scenes.begin(), scenes.end(), [](const Scene& scene) { return scene.is_completed; }));
}

bool ValidateProjectId(std::string_view project_id, std::string& error) {
  if (project_id.empty()) {
    error = "project id cannot be empty";
    return false;
  }
  if (project_id.size() > kMaxProjectIdLength) {
    error = "project id exceeds " + std::to_string(kMaxProjectIdLength) + " characters";
    return false;
  }
  if (project_id == "." || project_id == "..") {
    error = "project id cannot be '.' or '..'";
    return false;
  }
  for (const char c : project_id) {
    const bool allowed = std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' ||
                         c == '_' || c == '.';
    if (!allowed) {
      error = "project id '" + std::string(project_id) +
              "' contains characters outside [A-Za-z0-9._-]";
      return false;
    }
  }
  return true;
}

bool ValidateProject(const Project& project, const ArtifactPolicy& policy, std::string& error) {
  error.clear();
  if (!ValidateProjectId(project.project_id, error)) {
    return false;
  }
  if (project.title.empty()) {
    error = "project title cannot be empty";
    return false;
  }
  if (project.progress_percent > 100U) {
    error = "progress_percent must be within 0..100";
    return false;
  }
  // Records persist epoch milliseconds; finer values would not read back equal.
  if (!core::IsWholeMilliseconds(project.created_at) ||
      !core::IsWholeMilliseconds(project.updated_at) ||
      (project.completed_at.has_value() && !core::IsWholeMilliseconds(*project.completed_at))) {
    error = "project timestamps must be whole milliseconds";
    return false;
  }
  if (project.status == ProjectStatus::kDone && project.current_stage != PipelineStage::kDone) {
    error = "done project must be at stage 'done'";
    return false;
  }
  if (!ValidateScenes(project.scenes, policy, error)) {
    return false;
  }
  return ValidateCheckpoints(project.checkpoints, error);
}

} // namespace scenevault::model

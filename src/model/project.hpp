#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scenevault::model {

// Fixed generation pipeline order. Declaration order is the pipeline order and
// checkpoint ordering checks compare the underlying values directly.
enum class PipelineStage {
  kScript = 0,
  kAudio = 1,
  kImages = 2,
  kRender = 3,
  kDone = 4,
};

// Explicit project lifecycle. kDone and kCancelled are terminal.
enum class ProjectStatus {
  kCreated,
  kInProgress,
  kDone,
  kCancelled,
};

const char* ToString(PipelineStage stage);
bool ParsePipelineStage(std::string_view text, PipelineStage& stage);

const char* ToString(ProjectStatus status);
bool ParseProjectStatus(std::string_view text, ProjectStatus& status);

// True when `candidate` comes strictly before `reference` in pipeline order.
bool IsEarlierStage(PipelineStage candidate, PipelineStage reference);

bool IsTerminal(ProjectStatus status);

// Which per-scene artifacts must be present before a scene may be marked
// completed. Deployments without image generation turn `require_image` off.
struct ArtifactPolicy {
  bool require_audio = true;
  bool require_image = true;

  bool operator==(const ArtifactPolicy& other) const = default;
};

struct Scene {
  std::uint32_t index = 0;
  std::string script_text;
  double duration_seconds = 0.0;
  bool is_completed = false;
  std::optional<std::string> audio_file_path;
  std::optional<std::string> image_file_path;

  bool operator==(const Scene& other) const = default;
};

// One durable progress marker for a pipeline stage.
struct Checkpoint {
  std::uint64_t sequence = 0;
  PipelineStage stage = PipelineStage::kScript;
  std::chrono::system_clock::time_point checkpoint_time{};
  std::uint32_t completed_scenes = 0;
  std::uint32_t total_scenes = 0;
  std::optional<std::string> output_file_path;
  std::string checkpoint_data;
  bool is_valid = true;

  bool operator==(const Checkpoint& other) const = default;
};

// Full persisted project graph. One record per project id; no cross-project
// references, so a record can be read and reconciled on its own.
struct Project {
  std::string project_id;
  std::string title;
  std::string description;
  std::string job_id;
  PipelineStage current_stage = PipelineStage::kScript;
  ProjectStatus status = ProjectStatus::kCreated;
  std::uint32_t progress_percent = 0;
  std::chrono::system_clock::time_point created_at{};
  std::chrono::system_clock::time_point updated_at{};
  std::optional<std::chrono::system_clock::time_point> completed_at;
  std::string error_message;
  std::vector<Scene> scenes;
  // Accepted checkpoints, oldest first. The last entry is the latest one.
  std::vector<Checkpoint> checkpoints;

  bool operator==(const Project& other) const = default;

  const Checkpoint* LatestCheckpoint() const;
  bool IsTerminal() const;
  const Scene* FindScene(std::uint32_t index) const;
  Scene* FindScene(std::uint32_t index);
  std::uint32_t CompletedSceneCount() const;
};

// Project ids name storage directories, so they are restricted to
// [A-Za-z0-9._-], 1..128 characters, excluding "." and "..".
bool ValidateProjectId(std::string_view project_id, std::string& error);

// Structural invariants every persisted record must satisfy:
// - valid id, non-empty title, progress within 0..100
// - every timestamp is a whole number of milliseconds
// - scenes sorted by unique index
// - completed scenes have positive duration and the artifacts `policy` requires
// - checkpoints have increasing sequence/time and completed <= total
bool ValidateProject(const Project& project, const ArtifactPolicy& policy, std::string& error);

} // namespace scenevault::model

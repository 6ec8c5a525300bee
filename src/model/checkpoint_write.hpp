#pragma once

#include "model/project.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scenevault::model {

// Partial scene update carried by a checkpoint write. Absent fields keep the
// stored value; a scene index that does not exist yet is created.
struct SceneUpdate {
  std::uint32_t index = 0;
  std::optional<std::string> script_text;
  std::optional<double> duration_seconds;
  std::optional<bool> is_completed;
  std::optional<std::string> audio_file_path;
  std::optional<std::string> image_file_path;

  bool operator==(const SceneUpdate& other) const = default;
};

// One checkpoint-write call from a pipeline writer.
struct CheckpointWrite {
  std::string project_id;
  PipelineStage stage = PipelineStage::kScript;
  std::uint32_t completed_scenes = 0;
  std::uint32_t total_scenes = 0;
  std::optional<std::string> output_file_path;
  std::vector<SceneUpdate> scene_updates;
  std::string checkpoint_data;
  // Explicit progress. When absent the manager derives it from the stage.
  std::optional<std::uint32_t> progress_percent;

  bool operator==(const CheckpointWrite& other) const = default;
};

// Parses the request body accepted by `scenevault checkpoint <id> <file>`:
//   {"stage":"audio","completed_scenes":2,"total_scenes":3,
//    "output_file_path":"...","progress_percent":40,"checkpoint_data":"...",
//    "scenes":[{"index":0,"is_completed":true,"audio_file_path":"..."}]}
// `project_id` is not part of the body; callers set it from the route.
bool ParseCheckpointWriteJson(std::string_view text, CheckpointWrite& write, std::string& error);

} // namespace scenevault::model

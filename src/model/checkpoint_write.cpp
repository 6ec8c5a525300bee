#include "model/checkpoint_write.hpp"

#include "core/json_dom.hpp"

#include <cmath>
#include <limits>
#include <utility>

namespace scenevault::model {

namespace {

using JsonValue = core::json::Value;

bool ReadU32(const JsonValue& value, std::string_view key, std::uint32_t& out,
             std::string& error) {
  std::uint64_t wide = 0;
  if (!core::json::TryGetUnsigned(value, wide) ||
      wide > std::numeric_limits<std::uint32_t>::max()) {
    error = "field '" + std::string(key) + "' must be a non-negative 32-bit integer";
    return false;
  }
  out = static_cast<std::uint32_t>(wide);
  return true;
}

bool ReadOptionalString(const JsonValue& object, std::string_view key,
                        std::optional<std::string>& out, std::string& error) {
  const JsonValue* field = core::json::FindMember(object, key);
  if (core::json::IsNullOrAbsent(field)) {
    return true;
  }
  if (field->type != JsonValue::Type::kString) {
    error = "field '" + std::string(key) + "' must be a string";
    return false;
  }
  out = field->string_value;
  return true;
}

bool ParseSceneUpdate(const JsonValue& object, SceneUpdate& update, std::string& error) {
  update = SceneUpdate{};
  if (object.type != JsonValue::Type::kObject) {
    error = "scene update must be an object";
    return false;
  }

  const JsonValue* index = core::json::FindMember(object, "index");
  if (index == nullptr) {
    error = "scene update is missing required field 'index'";
    return false;
  }
  if (!ReadU32(*index, "index", update.index, error)) {
    return false;
  }

  const std::string label = "scene " + std::to_string(update.index) + ": ";
  if (!ReadOptionalString(object, "script_text", update.script_text, error) ||
      !ReadOptionalString(object, "audio_file_path", update.audio_file_path, error) ||
      !ReadOptionalString(object, "image_file_path", update.image_file_path, error)) {
    error = label + error;
    return false;
  }

  const JsonValue* duration = core::json::FindMember(object, "duration_seconds");
  if (!core::json::IsNullOrAbsent(duration)) {
    if (duration->type != JsonValue::Type::kNumber || !std::isfinite(duration->number_value) ||
        duration->number_value < 0.0) {
      error = label + "field 'duration_seconds' must be a non-negative number";
      return false;
    }
    update.duration_seconds = duration->number_value;
  }

  const JsonValue* completed = core::json::FindMember(object, "is_completed");
  if (!core::json::IsNullOrAbsent(completed)) {
    if (completed->type != JsonValue::Type::kBool) {
      error = label + "field 'is_completed' must be a boolean";
      return false;
    }
    update.is_completed = completed->bool_value;
  }
  return true;
}

} // namespace

bool ParseCheckpointWriteJson(std::string_view text, CheckpointWrite& write, std::string& error) {
  write = CheckpointWrite{};
  error.clear();

  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "checkpoint write must be a JSON object";
    return false;
  }

  std::string stage_text;
  if (!core::json::RequireString(root, "stage", stage_text, error)) {
    return false;
  }
  if (!ParsePipelineStage(stage_text, write.stage)) {
    error = "unsupported stage '" + stage_text + "' (expected script|audio|images|render|done)";
    return false;
  }

  for (const std::string_view key : {"completed_scenes", "total_scenes"}) {
    const JsonValue* field = core::json::FindMember(root, key);
    if (field == nullptr) {
      error = "missing required field '" + std::string(key) + "'";
      return false;
    }
    std::uint32_t& target =
        key == "completed_scenes" ? write.completed_scenes : write.total_scenes;
    if (!ReadU32(*field, key, target, error)) {
      return false;
    }
  }

  if (!ReadOptionalString(root, "output_file_path", write.output_file_path, error)) {
    return false;
  }

  std::optional<std::string> checkpoint_data;
  if (!ReadOptionalString(root, "checkpoint_data", checkpoint_data, error)) {
    return false;
  }
  write.checkpoint_data = checkpoint_data.value_or("");

  const JsonValue* progress = core::json::FindMember(root, "progress_percent");
  if (!core::json::IsNullOrAbsent(progress)) {
    std::uint32_t value = 0;
    if (!ReadU32(*progress, "progress_percent", value, error)) {
      return false;
    }
    write.progress_percent = value;
  }

  const JsonValue* scenes = core::json::FindMember(root, "scenes");
  if (!core::json::IsNullOrAbsent(scenes)) {
    if (scenes->type != JsonValue::Type::kArray) {
      error = "field 'scenes' must be an array";
      return false;
    }
    for (const JsonValue& item : scenes->array_value) {
      SceneUpdate update;
      if (!ParseSceneUpdate(item, update, error)) {
        return false;
      }
      write.scene_updates.push_back(std::move(update));
    }
  }
  return true;
}

} // namespace scenevault::model

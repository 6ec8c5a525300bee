#include "model/project_json.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <limits>
#include <sstream>
#include <utility>

namespace scenevault::model {

namespace {

using JsonValue = core::json::Value;

std::string OptionalPathJson(const std::optional<std::string>& path) {
  if (!path.has_value()) {
    return "null";
  }
  return core::QuoteJson(*path);
}

std::string SceneToJson(const Scene& scene) {
  std::ostringstream out;
  out << "{\"index\":" << scene.index << ",\"script_text\":" << core::QuoteJson(scene.script_text)
      << ",\"duration_seconds\":" << core::FormatJsonDouble(scene.duration_seconds)
      << ",\"is_completed\":" << (scene.is_completed ? "true" : "false")
      << ",\"audio_file_path\":" << OptionalPathJson(scene.audio_file_path)
      << ",\"image_file_path\":" << OptionalPathJson(scene.image_file_path) << "}";
  return out.str();
}

std::string CheckpointBodyJson(const Checkpoint& checkpoint) {
  std::ostringstream out;
  out << "\"sequence\":" << checkpoint.sequence << ",\"stage\":\"" << ToString(checkpoint.stage)
      << "\",\"checkpoint_time_epoch_ms\":"
      << core::ToEpochMilliseconds(checkpoint.checkpoint_time) << ",\"checkpoint_time_utc\":\""
      << core::FormatUtcTimestamp(checkpoint.checkpoint_time)
      << "\",\"completed_scenes\":" << checkpoint.completed_scenes
      << ",\"total_scenes\":" << checkpoint.total_scenes
      << ",\"output_file_path\":" << OptionalPathJson(checkpoint.output_file_path)
      << ",\"checkpoint_data\":" << core::QuoteJson(checkpoint.checkpoint_data)
      << ",\"is_valid\":" << (checkpoint.is_valid ? "true" : "false");
  return out.str();
}

bool ParseOptionalPath(const JsonValue& object, std::string_view key,
                       std::optional<std::string>& path, std::string& error) {
  path.reset();
  const JsonValue* field = core::json::FindMember(object, key);
  if (core::json::IsNullOrAbsent(field)) {
    return true;
  }
  if (field->type != JsonValue::Type::kString) {
    error = "field '" + std::string(key) + "' must be a string or null";
    return false;
  }
  path = field->string_value;
  return true;
}

bool ParseOptionalString(const JsonValue& object, std::string_view key, std::string& value,
                         std::string& error) {
  value.clear();
  const JsonValue* field = core::json::FindMember(object, key);
  if (core::json::IsNullOrAbsent(field)) {
    return true;
  }
  if (field->type != JsonValue::Type::kString) {
    error = "field '" + std::string(key) + "' must be a string";
    return false;
  }
  value = field->string_value;
  return true;
}

bool RequireU32(const JsonValue& object, std::string_view key, std::uint32_t& out,
                std::string& error) {
  std::uint64_t wide = 0;
  if (!core::json::RequireUnsigned(object, key, wide, error)) {
    return false;
  }
  if (wide > std::numeric_limits<std::uint32_t>::max()) {
    error = "field '" + std::string(key) + "' is out of range";
    return false;
  }
  out = static_cast<std::uint32_t>(wide);
  return true;
}

bool ParseSceneObject(const JsonValue& object, Scene& scene, std::string& error) {
  scene = Scene{};
  if (object.type != JsonValue::Type::kObject) {
    error = "scene entry must be an object";
    return false;
  }
  return RequireU32(object, "index", scene.index, error) &&
         core::json::RequireString(object, "script_text", scene.script_text, error) &&
         core::json::RequireNumber(object, "duration_seconds", scene.duration_seconds, error) &&
         core::json::RequireBool(object, "is_completed", scene.is_completed, error) &&
         ParseOptionalPath(object, "audio_file_path", scene.audio_file_path, error) &&
         ParseOptionalPath(object, "image_file_path", scene.image_file_path, error);
}

bool RequireArray(const JsonValue& object, std::string_view key, const JsonValue*& out,
                  std::string& error) {
  out = core::json::FindMember(object, key);
  if (out == nullptr || out->type != JsonValue::Type::kArray) {
    error = "field '" + std::string(key) + "' must be an array";
    return false;
  }
  return true;
}

} // namespace

std::string ToJson(const Project& project) {
  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\": \"" << kRecordSchemaVersion << "\",\n"
      << "  \"project_id\": " << core::QuoteJson(project.project_id) << ",\n"
      << "  \"title\": " << core::QuoteJson(project.title) << ",\n"
      << "  \"description\": " << core::QuoteJson(project.description) << ",\n"
      << "  \"job_id\": " << core::QuoteJson(project.job_id) << ",\n"
      << "  \"current_stage\": \"" << ToString(project.current_stage) << "\",\n"
      << "  \"status\": \"" << ToString(project.status) << "\",\n"
      << "  \"progress_percent\": " << project.progress_percent << ",\n"
      << "  \"created_at_epoch_ms\": " << core::ToEpochMilliseconds(project.created_at) << ",\n"
      << "  \"updated_at_epoch_ms\": " << core::ToEpochMilliseconds(project.updated_at) << ",\n"
      << "  \"completed_at_epoch_ms\": "
      << (project.completed_at.has_value()
              ? std::to_string(core::ToEpochMilliseconds(*project.completed_at))
              : std::string("null"))
      << ",\n"
      << "  \"error_message\": " << core::QuoteJson(project.error_message) << ",\n"
      << "  \"scenes\": [";
  for (std::size_t i = 0; i < project.scenes.size(); ++i) {
    out << (i == 0U ? "\n    " : ",\n    ") << SceneToJson(project.scenes[i]);
  }
  out << (project.scenes.empty() ? "],\n" : "\n  ],\n") << "  \"checkpoints\": [";
  for (std::size_t i = 0; i < project.checkpoints.size(); ++i) {
    out << (i == 0U ? "\n    {" : ",\n    {") << CheckpointBodyJson(project.checkpoints[i])
        << "}";
  }
  out << (project.checkpoints.empty() ? "]\n" : "\n  ]\n") << "}\n";
  return out.str();
}

std::string ToJson(const Checkpoint& checkpoint, std::string_view project_id) {
  std::ostringstream out;
  out << "{\"schema_version\":\"" << kRecordSchemaVersion
      << "\",\"project_id\":" << core::QuoteJson(project_id) << ","
      << CheckpointBodyJson(checkpoint) << "}\n";
  return out.str();
}

bool ParseCheckpointObject(const JsonValue& object, Checkpoint& checkpoint, std::string& error) {
  checkpoint = Checkpoint{};
  if (object.type != JsonValue::Type::kObject) {
    error = "checkpoint entry must be an object";
    return false;
  }

  std::string stage_text;
  std::int64_t checkpoint_time_ms = 0;
  if (!core::json::RequireUnsigned(object, "sequence", checkpoint.sequence, error) ||
      !core::json::RequireString(object, "stage", stage_text, error) ||
      !core::json::RequireInteger(object, "checkpoint_time_epoch_ms", checkpoint_time_ms, error) ||
      !RequireU32(object, "completed_scenes", checkpoint.completed_scenes, error) ||
      !RequireU32(object, "total_scenes", checkpoint.total_scenes, error) ||
      !ParseOptionalPath(object, "output_file_path", checkpoint.output_file_path, error) ||
      !ParseOptionalString(object, "checkpoint_data", checkpoint.checkpoint_data, error) ||
      !core::json::RequireBool(object, "is_valid", checkpoint.is_valid, error)) {
    return false;
  }
  if (!ParsePipelineStage(stage_text, checkpoint.stage)) {
    error = "unsupported checkpoint stage: " + stage_text;
    return false;
  }
  checkpoint.checkpoint_time = core::FromEpochMilliseconds(checkpoint_time_ms);
  return true;
}

bool ParseProjectJson(std::string_view text, Project& project, std::string& error) {
  project = Project{};
  error.clear();

  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "project record root must be a JSON object";
    return false;
  }

  std::string schema_version;
  std::string stage_text;
  std::string status_text;
  std::uint64_t progress = 0;
  std::int64_t created_at_ms = 0;
  std::int64_t updated_at_ms = 0;
  if (!core::json::RequireString(root, "schema_version", schema_version, error) ||
      !core::json::RequireString(root, "project_id", project.project_id, error) ||
      !core::json::RequireString(root, "title", project.title, error) ||
      !ParseOptionalString(root, "description", project.description, error) ||
      !core::json::RequireString(root, "job_id", project.job_id, error) ||
      !core::json::RequireString(root, "current_stage", stage_text, error) ||
      !core::json::RequireString(root, "status", status_text, error) ||
      !core::json::RequireUnsigned(root, "progress_percent", progress, error) ||
      !core::json::RequireInteger(root, "created_at_epoch_ms", created_at_ms, error) ||
      !core::json::RequireInteger(root, "updated_at_epoch_ms", updated_at_ms, error) ||
      !ParseOptionalString(root, "error_message", project.error_message, error)) {
    return false;
  }
  if (schema_version != kRecordSchemaVersion) {
    error = "unsupported record schema_version: " + schema_version;
    return false;
  }
  if (!ParsePipelineStage(stage_text, project.current_stage)) {
    error = "unsupported current_stage: " + stage_text;
    return false;
  }
  if (!ParseProjectStatus(status_text, project.status)) {
    error = "unsupported status: " + status_text;
    return false;
  }
  if (progress > 100U) {
    error = "progress_percent must be within 0..100";
    return false;
  }
  project.progress_percent = static_cast<std::uint32_t>(progress);
  project.created_at = core::FromEpochMilliseconds(created_at_ms);
  project.updated_at = core::FromEpochMilliseconds(updated_at_ms);

  const JsonValue* completed_at = core::json::FindMember(root, "completed_at_epoch_ms");
  if (!core::json::IsNullOrAbsent(completed_at)) {
    std::int64_t completed_at_ms = 0;
    if (!core::json::TryGetInteger(*completed_at, completed_at_ms)) {
      error = "field 'completed_at_epoch_ms' must be an integer or null";
      return false;
    }
    project.completed_at = core::FromEpochMilliseconds(completed_at_ms);
  }

  const JsonValue* scenes = nullptr;
  if (!RequireArray(root, "scenes", scenes, error)) {
    return false;
  }
  for (const JsonValue& item : scenes->array_value) {
    Scene scene;
    if (!ParseSceneObject(item, scene, error)) {
      return false;
    }
    project.scenes.push_back(std::move(scene));
  }

  const JsonValue* checkpoints = nullptr;
  if (!RequireArray(root, "checkpoints", checkpoints, error)) {
    return false;
  }
  for (const JsonValue& item : checkpoints->array_value) {
    Checkpoint checkpoint;
    if (!ParseCheckpointObject(item, checkpoint, error)) {
      return false;
    }
    project.checkpoints.push_back(std::move(checkpoint));
  }

  const ArtifactPolicy structural_only{false, false};
  return ValidateProject(project, structural_only, error);
}

} // namespace scenevault::model

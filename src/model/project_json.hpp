#pragma once

#include "core/json_dom.hpp"
#include "model/project.hpp"

#include <string>
#include <string_view>

namespace scenevault::model {

// Record schema version written into every persisted project/checkpoint file.
inline constexpr std::string_view kRecordSchemaVersion = "1.0";

// Serializes the full project graph (scenes + checkpoint history) as the
// durable `project.json` record.
std::string ToJson(const Project& project);

// Serializes one checkpoint as a standalone history record.
std::string ToJson(const Checkpoint& checkpoint, std::string_view project_id);

// Strict parser for `project.json`. Every field written by ToJson is required
// except `description`, `error_message` and nullable paths; structural
// invariants are checked with ValidateProject (artifact policy not applied,
// since records outlive policy changes).
bool ParseProjectJson(std::string_view text, Project& project, std::string& error);

bool ParseCheckpointObject(const core::json::Value& object, Checkpoint& checkpoint,
                           std::string& error);

} // namespace scenevault::model

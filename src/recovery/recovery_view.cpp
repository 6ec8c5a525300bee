#include "recovery/recovery_view.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>
#include <utility>

namespace scenevault::recovery {

namespace {

std::string OptionalStringJson(const std::optional<std::string>& value) {
  return value.has_value() ? core::QuoteJson(*value) : std::string("null");
}

std::string StringArrayJson(const std::vector<std::string>& values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0U) {
      out += ",";
    }
    out += core::QuoteJson(values[i]);
  }
  out += "]";
  return out;
}

std::string CheckpointJson(const std::optional<model::Checkpoint>& checkpoint) {
  if (!checkpoint.has_value()) {
    return "null";
  }
  std::ostringstream out;
  out << "{\"sequence\":" << checkpoint->sequence << ",\"stage\":\""
      << model::ToString(checkpoint->stage) << "\",\"checkpoint_time_utc\":\""
      << core::FormatUtcTimestamp(checkpoint->checkpoint_time)
      << "\",\"completed_scenes\":" << checkpoint->completed_scenes
      << ",\"total_scenes\":" << checkpoint->total_scenes
      << ",\"output_file_path\":" << OptionalStringJson(checkpoint->output_file_path)
      << ",\"checkpoint_data\":" << core::QuoteJson(checkpoint->checkpoint_data)
      << ",\"is_valid\":" << (checkpoint->is_valid ? "true" : "false") << "}";
  return out.str();
}

// Fields shared by summary and detail forms, without the closing brace.
void WriteCommonFields(std::ostringstream& out, const RecoveryView& view) {
  const model::Project& project = view.project;
  out << "{\"project_id\":" << core::QuoteJson(project.project_id)
      << ",\"title\":" << core::QuoteJson(project.title)
      << ",\"job_id\":" << core::QuoteJson(project.job_id) << ",\"current_stage\":\""
      << model::ToString(project.current_stage) << "\",\"status\":\""
      << model::ToString(project.status) << "\",\"progress_percent\":" << project.progress_percent
      << ",\"created_at_utc\":\"" << core::FormatUtcTimestamp(project.created_at)
      << "\",\"updated_at_utc\":\"" << core::FormatUtcTimestamp(project.updated_at)
      << "\",\"scene_count\":" << project.scenes.size()
      << ",\"completed_scene_count\":" << project.CompletedSceneCount()
      << ",\"error_message\":" << core::QuoteJson(project.error_message)
      << ",\"latest_checkpoint\":" << CheckpointJson(view.latest_checkpoint)
      << ",\"files_exist\":" << (view.files_exist ? "true" : "false")
      << ",\"missing_files\":" << StringArrayJson(view.missing_files)
      << ",\"can_recover\":" << (view.can_recover ? "true" : "false");
}

} // namespace

bool ComputeCanRecover(const model::Project& project, const reconcile::ReconcileReport& report) {
  return report.files_exist && project.LatestCheckpoint() != nullptr && !project.IsTerminal();
}

RecoveryView BuildRecoveryView(model::Project project, const reconcile::ReconcileReport& report) {
  RecoveryView view;
  view.can_recover = ComputeCanRecover(project, report);
  view.files_exist = report.files_exist;
  view.missing_files = report.missing_files;
  if (const model::Checkpoint* latest = project.LatestCheckpoint(); latest != nullptr) {
    view.latest_checkpoint = *latest;
  }
  view.project = std::move(project);
  return view;
}

std::string ToSummaryJson(const RecoveryView& view) {
  std::ostringstream out;
  WriteCommonFields(out, view);
  out << "}";
  return out.str();
}

std::string ToSummaryListJson(const std::vector<RecoveryView>& views) {
  std::string out = "[";
  for (std::size_t i = 0; i < views.size(); ++i) {
    out += i == 0U ? "\n  " : ",\n  ";
    out += ToSummaryJson(views[i]);
  }
  out += views.empty() ? "]\n" : "\n]\n";
  return out;
}

std::string ToDetailJson(const RecoveryView& view) {
  const model::Project& project = view.project;
  std::ostringstream out;
  WriteCommonFields(out, view);
  out << ",\"description\":" << core::QuoteJson(project.description) << ",\"completed_at_utc\":"
      << (project.completed_at.has_value()
              ? core::QuoteJson(core::FormatUtcTimestamp(*project.completed_at))
              : std::string("null"))
      << ",\"checkpoint_count\":" << project.checkpoints.size() << ",\"scenes\":[";
  for (std::size_t i = 0; i < project.scenes.size(); ++i) {
    const model::Scene& scene = project.scenes[i];
    out << (i == 0U ? "" : ",") << "{\"index\":" << scene.index
        << ",\"script_text\":" << core::QuoteJson(scene.script_text)
        << ",\"duration_seconds\":" << core::FormatJsonDouble(scene.duration_seconds)
        << ",\"is_completed\":" << (scene.is_completed ? "true" : "false")
        << ",\"audio_file_path\":" << OptionalStringJson(scene.audio_file_path)
        << ",\"image_file_path\":" << OptionalStringJson(scene.image_file_path) << "}";
  }
  out << "]}\n";
  return out.str();
}

} // namespace scenevault::recovery

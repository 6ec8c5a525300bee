#include "../common/project_fixtures.hpp"
#include "recovery/checkpoint_order.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

namespace model = scenevault::model;
namespace recovery = scenevault::recovery;
using scenevault::core::errors::ErrorKind;
using scenevault::core::errors::OperationError;
using scenevault::tests::common::BuildSampleProject;
using scenevault::tests::common::BuildWrite;
using scenevault::tests::common::CompletedSceneUpdate;
using scenevault::tests::common::FixtureEpoch;

namespace {

recovery::ApplyOptions OptionsAt(std::chrono::milliseconds offset) {
  recovery::ApplyOptions options;
  options.now = FixtureEpoch() + offset;
  return options;
}

} // namespace

TEST_CASE("Derived progress follows stage bands", "[recovery][order]") {
  REQUIRE(recovery::DeriveProgressPercent(model::PipelineStage::kScript, 0, 4) == 0U);
  REQUIRE(recovery::DeriveProgressPercent(model::PipelineStage::kScript, 4, 4) == 10U);
  REQUIRE(recovery::DeriveProgressPercent(model::PipelineStage::kAudio, 2, 3) == 30U);
  REQUIRE(recovery::DeriveProgressPercent(model::PipelineStage::kImages, 0, 0) == 40U);
  REQUIRE(recovery::DeriveProgressPercent(model::PipelineStage::kRender, 4, 4) == 95U);
  REQUIRE(recovery::DeriveProgressPercent(model::PipelineStage::kDone, 0, 4) == 100U);
}

TEST_CASE("Accepted write appends the next checkpoint", "[recovery][order]") {
  model::Project project = BuildSampleProject("P1");
  model::CheckpointWrite write = BuildWrite("P1", model::PipelineStage::kAudio, 3, 3);
  write.scene_updates.push_back(CompletedSceneUpdate(2, "/tmp/sv"));
  write.output_file_path = "/tmp/sv/audio_mix.wav";

  OperationError error;
  REQUIRE(recovery::ApplyCheckpointWrite(project, write, OptionsAt(std::chrono::seconds(10)),
                                         error));
  REQUIRE(project.checkpoints.size() == 3U);
  const model::Checkpoint& latest = project.checkpoints.back();
  REQUIRE(latest.sequence == 3U);
  REQUIRE(latest.completed_scenes == 3U);
  REQUIRE(latest.output_file_path == std::optional<std::string>("/tmp/sv/audio_mix.wav"));
  REQUIRE(latest.checkpoint_time == FixtureEpoch() + std::chrono::seconds(10));
  REQUIRE(project.scenes[2].is_completed);
  REQUIRE(project.progress_percent == 40U);
  REQUIRE(project.status == model::ProjectStatus::kInProgress);
  REQUIRE(project.updated_at == latest.checkpoint_time);
}

TEST_CASE("Fewer completed scenes in the same stage is out of order", "[recovery][order]") {
  model::Project project = BuildSampleProject("P1");
  const model::Project before = project;

  OperationError error;
  REQUIRE_FALSE(recovery::ApplyCheckpointWrite(
      project, BuildWrite("P1", model::PipelineStage::kAudio, 1, 3),
      OptionsAt(std::chrono::seconds(10)), error));
  REQUIRE(error.Is(ErrorKind::kInvalidCheckpointOrder));
  REQUIRE(project == before);
}

TEST_CASE("Equal count in the same stage is accepted", "[recovery][order]") {
  model::Project project = BuildSampleProject("P1");
  OperationError error;
  REQUIRE(recovery::ApplyCheckpointWrite(project,
                                         BuildWrite("P1", model::PipelineStage::kAudio, 2, 3),
                                         OptionsAt(std::chrono::seconds(10)), error));
  REQUIRE(project.checkpoints.back().sequence == 3U);
}

TEST_CASE("Earlier stage is out of order", "[recovery][order]") {
  model::Project project = BuildSampleProject("P1");
  OperationError error;
  REQUIRE_FALSE(recovery::ApplyCheckpointWrite(
      project, BuildWrite("P1", model::PipelineStage::kScript, 3, 3),
      OptionsAt(std::chrono::seconds(10)), error));
  REQUIRE(error.Is(ErrorKind::kInvalidCheckpointOrder));
  REQUIRE(error.message.find("earlier than 'audio'") != std::string::npos);
}

TEST_CASE("Explicit progress below current is out of order", "[recovery][order]") {
  model::Project project = BuildSampleProject("P1");
  model::CheckpointWrite write = BuildWrite("P1", model::PipelineStage::kImages, 0, 3);
  write.progress_percent = 20U;
  OperationError error;
  REQUIRE_FALSE(recovery::ApplyCheckpointWrite(project, write,
                                               OptionsAt(std::chrono::seconds(10)), error));
  REQUIRE(error.Is(ErrorKind::kInvalidCheckpointOrder));
}

TEST_CASE("Malformed writes are invalid arguments", "[recovery][order]") {
  model::Project project = BuildSampleProject("P1");
  OperationError error;

  REQUIRE_FALSE(recovery::ApplyCheckpointWrite(
      project, BuildWrite("P1", model::PipelineStage::kImages, 4, 3),
      OptionsAt(std::chrono::seconds(10)), error));
  REQUIRE(error.Is(ErrorKind::kInvalidArgument));

  model::CheckpointWrite out_of_range = BuildWrite("P1", model::PipelineStage::kImages, 1, 3);
  out_of_range.scene_updates.push_back(CompletedSceneUpdate(3, "/tmp/sv"));
  REQUIRE_FALSE(recovery::ApplyCheckpointWrite(project, out_of_range,
                                               OptionsAt(std::chrono::seconds(10)), error));
  REQUIRE(error.Is(ErrorKind::kInvalidArgument));

  model::CheckpointWrite missing_image = BuildWrite("P1", model::PipelineStage::kAudio, 3, 3);
  model::SceneUpdate update = CompletedSceneUpdate(2, "/tmp/sv");
  update.image_file_path.reset();
  missing_image.scene_updates.push_back(update);
  REQUIRE_FALSE(recovery::ApplyCheckpointWrite(project, missing_image,
                                               OptionsAt(std::chrono::seconds(10)), error));
  REQUIRE(error.Is(ErrorKind::kInvalidArgument));
  REQUIRE(error.message.find("no image file path") != std::string::npos);
}

TEST_CASE("Total scene count cannot drop below stored scene indexes", "[recovery][order]") {
  model::Project project = BuildSampleProject("P1");
  const model::Project before = project;
  OperationError error;

  REQUIRE_FALSE(recovery::ApplyCheckpointWrite(
      project, BuildWrite("P1", model::PipelineStage::kImages, 1, 2),
      OptionsAt(std::chrono::seconds(10)), error));
  REQUIRE(error.Is(ErrorKind::kInvalidArgument));
  REQUIRE(error.message.find("stored scene index 2") != std::string::npos);
  REQUIRE(project == before);

  REQUIRE(recovery::ApplyCheckpointWrite(project,
                                         BuildWrite("P1", model::PipelineStage::kImages, 1, 5),
                                         OptionsAt(std::chrono::seconds(10)), error));
  REQUIRE(project.checkpoints.back().total_scenes == 5U);
}

TEST_CASE("Terminal projects reject writes before any other check", "[recovery][order]") {
  model::Project project = BuildSampleProject("P1");
  project.status = model::ProjectStatus::kCancelled;
  OperationError error;
  REQUIRE_FALSE(recovery::ApplyCheckpointWrite(
      project, BuildWrite("P1", model::PipelineStage::kScript, 9, 3),
      OptionsAt(std::chrono::seconds(10)), error));
  REQUIRE(error.Is(ErrorKind::kProjectTerminated));
}

TEST_CASE("Checkpoint time strictly increases under a frozen clock", "[recovery][order]") {
  model::Project project = BuildSampleProject("P1");
  const auto latest_time = project.checkpoints.back().checkpoint_time;
  const recovery::ApplyOptions frozen = OptionsAt(std::chrono::milliseconds(0));

  OperationError error;
  REQUIRE(recovery::ApplyCheckpointWrite(
      project, BuildWrite("P1", model::PipelineStage::kAudio, 2, 3), frozen, error));
  REQUIRE(recovery::ApplyCheckpointWrite(
      project, BuildWrite("P1", model::PipelineStage::kAudio, 2, 3), frozen, error));
  REQUIRE(project.checkpoints[2].checkpoint_time == latest_time + std::chrono::milliseconds(1));
  REQUIRE(project.checkpoints[3].checkpoint_time == latest_time + std::chrono::milliseconds(2));
}

TEST_CASE("Done stage completes the project", "[recovery][order]") {
  model::Project project = BuildSampleProject("P1");
  model::CheckpointWrite write = BuildWrite("P1", model::PipelineStage::kDone, 3, 3);
  write.scene_updates.push_back(CompletedSceneUpdate(2, "/tmp/sv"));

  OperationError error;
  REQUIRE(recovery::ApplyCheckpointWrite(project, write, OptionsAt(std::chrono::seconds(30)),
                                         error));
  REQUIRE(project.status == model::ProjectStatus::kDone);
  REQUIRE(project.progress_percent == 100U);
  REQUIRE(project.completed_at == std::optional(project.checkpoints.back().checkpoint_time));
  REQUIRE(project.IsTerminal());
}

TEST_CASE("History is trimmed to the configured limit", "[recovery][order]") {
  model::Project project = BuildSampleProject("P1");
  recovery::ApplyOptions options = OptionsAt(std::chrono::seconds(10));
  options.max_checkpoint_history = 2U;

  OperationError error;
  REQUIRE(recovery::ApplyCheckpointWrite(
      project, BuildWrite("P1", model::PipelineStage::kImages, 1, 3), options, error));
  REQUIRE(project.checkpoints.size() == 2U);
  REQUIRE(project.checkpoints.front().sequence == 2U);
  REQUIRE(project.checkpoints.back().sequence == 3U);
}

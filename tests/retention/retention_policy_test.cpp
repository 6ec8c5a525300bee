#include "../common/project_fixtures.hpp"
#include "retention/retention_policy.hpp"
#include "store/testing/memory_checkpoint_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

namespace model = scenevault::model;
namespace retention = scenevault::retention;
using scenevault::core::errors::ErrorKind;
using scenevault::core::errors::OperationError;
using scenevault::core::logging::Logger;
using scenevault::core::logging::LogLevel;
using scenevault::store::testing::MemoryCheckpointStore;
using scenevault::tests::common::BuildSampleProject;
using scenevault::tests::common::FixtureEpoch;

namespace {

constexpr auto kDay = std::chrono::hours(24);

model::Project TerminalProject(const std::string& id, model::ProjectStatus status,
                               std::chrono::hours age_at_fixture) {
  model::Project project = BuildSampleProject(id);
  project.status = status;
  if (status == model::ProjectStatus::kDone) {
    project.current_stage = model::PipelineStage::kDone;
    project.completed_at = FixtureEpoch() - age_at_fixture;
  } else {
    project.updated_at = FixtureEpoch() - age_at_fixture;
  }
  return project;
}

void Seed(MemoryCheckpointStore& store, const model::Project& project) {
  OperationError error;
  REQUIRE(store.Put(project, error));
}

} // namespace

TEST_CASE("Only aged terminal projects are eligible", "[retention]") {
  const retention::RetentionPolicy policy;
  const auto now = FixtureEpoch();

  REQUIRE(retention::IsPurgeEligible(
      TerminalProject("a", model::ProjectStatus::kDone, kDay * 31), policy, now));
  REQUIRE_FALSE(retention::IsPurgeEligible(
      TerminalProject("b", model::ProjectStatus::kDone, kDay * 29), policy, now));
  REQUIRE(retention::IsPurgeEligible(
      TerminalProject("c", model::ProjectStatus::kCancelled, kDay * 31), policy, now));

  model::Project in_progress = BuildSampleProject("d");
  in_progress.updated_at = now - kDay * 400;
  REQUIRE_FALSE(retention::IsPurgeEligible(in_progress, policy, now));

  retention::RetentionPolicy keep_done = policy;
  keep_done.include_done = false;
  REQUIRE_FALSE(retention::IsPurgeEligible(
      TerminalProject("a", model::ProjectStatus::kDone, kDay * 31), keep_done, now));
}

TEST_CASE("Purge deletes eligible projects and keeps the rest", "[retention]") {
  std::ostringstream log;
  Logger logger(LogLevel::kInfo, log);
  MemoryCheckpointStore store;
  Seed(store, TerminalProject("old-done", model::ProjectStatus::kDone, kDay * 60));
  Seed(store, TerminalProject("old-cancel", model::ProjectStatus::kCancelled, kDay * 45));
  Seed(store, TerminalProject("new-done", model::ProjectStatus::kDone, kDay * 2));
  Seed(store, BuildSampleProject("running"));

  retention::PurgeReport report;
  OperationError error;
  REQUIRE(retention::PurgeExpiredProjects(store, retention::RetentionPolicy{}, FixtureEpoch(),
                                          logger, report, error));
  REQUIRE(report.scanned == 4U);
  REQUIRE(report.purged_project_ids == std::vector<std::string>{"old-cancel", "old-done"});

  std::vector<model::Project> remaining;
  REQUIRE(store.List(remaining, error));
  REQUIRE(remaining.size() == 2U);
  REQUIRE(retention::ToJson(report, false) ==
          "{\"dry_run\":false,\"scanned\":4,\"purged\":[\"old-cancel\",\"old-done\"],"
          "\"failed\":[]}\n");
}

TEST_CASE("Dry run reports without deleting", "[retention]") {
  std::ostringstream log;
  Logger logger(LogLevel::kInfo, log);
  MemoryCheckpointStore store;
  Seed(store, TerminalProject("old-done", model::ProjectStatus::kDone, kDay * 60));

  retention::RetentionPolicy policy;
  policy.dry_run = true;
  retention::PurgeReport report;
  OperationError error;
  REQUIRE(retention::PurgeExpiredProjects(store, policy, FixtureEpoch(), logger, report, error));
  REQUIRE(report.purged_project_ids == std::vector<std::string>{"old-done"});
  REQUIRE(store.CommitCount() == 1U);

  model::Project still_there;
  REQUIRE(store.Get("old-done", still_there, error));
}

TEST_CASE("Unlistable store fails the purge", "[retention]") {
  std::ostringstream log;
  Logger logger(LogLevel::kInfo, log);
  MemoryCheckpointStore store;
  store.FailNextOperations(1);

  retention::PurgeReport report;
  OperationError error;
  REQUIRE_FALSE(retention::PurgeExpiredProjects(store, retention::RetentionPolicy{},
                                                FixtureEpoch(), logger, report, error));
  REQUIRE(error.Is(ErrorKind::kStoreUnavailable));
}

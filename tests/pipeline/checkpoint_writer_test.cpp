#include "../common/project_fixtures.hpp"
#include "pipeline/checkpoint_writer.hpp"
#include "recovery/checkpoint_manager.hpp"
#include "store/testing/memory_checkpoint_store.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

namespace model = scenevault::model;
namespace pipeline = scenevault::pipeline;
namespace recovery = scenevault::recovery;
namespace reconcile = scenevault::reconcile;
using scenevault::core::errors::ErrorKind;
using scenevault::core::errors::OperationError;
using scenevault::core::logging::Logger;
using scenevault::core::logging::LogLevel;
using scenevault::store::testing::MemoryCheckpointStore;
using scenevault::tests::common::BuildWrite;

namespace {

struct WriterHarness {
  std::ostringstream log;
  Logger logger{LogLevel::kDebug, log};
  MemoryCheckpointStore store;
  reconcile::FileReconciler reconciler{reconcile::ReconcilerOptions{}, nullptr, logger};
  recovery::CheckpointManager manager{store, reconciler, logger};
  std::vector<std::chrono::milliseconds> sleeps;

  WriterHarness() {
    recovery::CreateProjectRequest request;
    request.project_id = "P1";
    request.title = "writer job";
    model::Project created;
    OperationError error;
    REQUIRE(manager.CreateProject(request, created, error));
  }

  pipeline::ProjectCheckpointWriter MakeWriter(pipeline::RetryPolicy policy = {}) {
    return pipeline::ProjectCheckpointWriter(
        manager, "P1", policy, logger,
        [this](std::chrono::milliseconds delay) { sleeps.push_back(delay); });
  }
};

} // namespace

TEST_CASE("Backoff grows geometrically and is capped", "[pipeline][writer]") {
  pipeline::RetryPolicy policy;
  REQUIRE(pipeline::ComputeBackoff(policy, 0) == std::chrono::milliseconds(50));
  REQUIRE(pipeline::ComputeBackoff(policy, 1) == std::chrono::milliseconds(100));
  REQUIRE(pipeline::ComputeBackoff(policy, 3) == std::chrono::milliseconds(400));
  REQUIRE(pipeline::ComputeBackoff(policy, 10) == std::chrono::milliseconds(1000));

  policy.initial_backoff = std::chrono::milliseconds(0);
  REQUIRE(pipeline::ComputeBackoff(policy, 2) == std::chrono::milliseconds(0));
}

TEST_CASE("Writer retries transient store failures", "[pipeline][writer]") {
  WriterHarness h;
  pipeline::ProjectCheckpointWriter writer = h.MakeWriter();
  h.store.FailNextOperations(2);

  model::Project committed;
  OperationError error;
  REQUIRE(writer.Write(BuildWrite("ignored", model::PipelineStage::kScript, 1, 2), committed,
                       error));
  REQUIRE(committed.project_id == "P1");
  REQUIRE(writer.AttemptsUsedTotal() == 3U);
  REQUIRE(h.sleeps == std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(50),
                                                              std::chrono::milliseconds(100)});
  REQUIRE(h.log.str().find("checkpoint write retry scheduled") != std::string::npos);
}

TEST_CASE("Writer gives up after the attempt budget", "[pipeline][writer]") {
  WriterHarness h;
  pipeline::RetryPolicy policy;
  policy.max_attempts = 2;
  pipeline::ProjectCheckpointWriter writer = h.MakeWriter(policy);
  h.store.FailNextOperations(5);

  model::Project committed;
  OperationError error;
  REQUIRE_FALSE(writer.Write(BuildWrite("P1", model::PipelineStage::kScript, 1, 2), committed,
                             error));
  REQUIRE(error.Is(ErrorKind::kStoreUnavailable));
  REQUIRE(writer.AttemptsUsedTotal() == 2U);
  REQUIRE(h.sleeps.size() == 1U);
  REQUIRE_FALSE(writer.IsStopped());
  REQUIRE(h.log.str().find("checkpoint write attempts exhausted") != std::string::npos);
}

TEST_CASE("Out-of-order writes are not retried", "[pipeline][writer]") {
  WriterHarness h;
  pipeline::ProjectCheckpointWriter writer = h.MakeWriter();
  model::Project committed;
  OperationError error;
  REQUIRE(writer.Write(BuildWrite("P1", model::PipelineStage::kImages, 1, 2), committed, error));
  REQUIRE_FALSE(writer.Write(BuildWrite("P1", model::PipelineStage::kAudio, 2, 2), committed,
                             error));
  REQUIRE(error.Is(ErrorKind::kInvalidCheckpointOrder));
  REQUIRE(writer.AttemptsUsedTotal() == 2U);
  REQUIRE_FALSE(writer.IsStopped());
}

TEST_CASE("Writer stops for good once the project is cancelled", "[pipeline][writer]") {
  WriterHarness h;
  pipeline::ProjectCheckpointWriter writer = h.MakeWriter();
  model::Project committed;
  OperationError error;
  REQUIRE(writer.Write(BuildWrite("P1", model::PipelineStage::kScript, 1, 2), committed, error));
  REQUIRE_FALSE(writer.ShouldStop());

  recovery::CancelOutcome outcome = recovery::CancelOutcome::kAlreadyTerminal;
  REQUIRE(h.manager.CancelProject("P1", outcome, error));

  REQUIRE_FALSE(writer.Write(BuildWrite("P1", model::PipelineStage::kScript, 2, 2), committed,
                             error));
  REQUIRE(error.Is(ErrorKind::kProjectTerminated));
  REQUIRE(writer.IsStopped());
  const std::size_t commits = h.store.CommitCount();
  const std::uint32_t attempts = writer.AttemptsUsedTotal();

  REQUIRE_FALSE(writer.Write(BuildWrite("P1", model::PipelineStage::kScript, 2, 2), committed,
                             error));
  REQUIRE(error.Is(ErrorKind::kProjectTerminated));
  REQUIRE(writer.AttemptsUsedTotal() == attempts);
  REQUIRE(h.store.CommitCount() == commits);
  REQUIRE(writer.ShouldStop());
}

TEST_CASE("Cancellation poll latches the stop", "[pipeline][writer]") {
  WriterHarness h;
  pipeline::ProjectCheckpointWriter writer = h.MakeWriter();
  OperationError error;
  REQUIRE(h.manager.DiscardProject("P1", error));
  REQUIRE(writer.ShouldStop());
  REQUIRE(writer.IsStopped());
}

TEST_CASE("Store trouble during a poll is not a stop signal", "[pipeline][writer]") {
  WriterHarness h;
  pipeline::ProjectCheckpointWriter writer = h.MakeWriter();
  h.store.FailNextOperations(1);
  REQUIRE_FALSE(writer.ShouldStop());
  REQUIRE_FALSE(writer.IsStopped());
}

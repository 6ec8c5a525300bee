#include "../common/project_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "reconcile/file_reconciler.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
namespace model = scenevault::model;
namespace reconcile = scenevault::reconcile;
using scenevault::core::logging::Logger;
using scenevault::core::logging::LogLevel;
using scenevault::tests::common::BuildSampleProject;
using scenevault::tests::common::ScopedTempDir;
using scenevault::tests::common::TouchProjectArtifacts;
using scenevault::tests::common::WriteStringToFile;

namespace {

// Simulates a hung network mount.
class SlowPathProbe final : public reconcile::IPathProbe {
public:
  explicit SlowPathProbe(std::chrono::milliseconds delay) : delay_(delay) {}

  bool Probe(const fs::path& path, bool& exists, std::string& error) override {
    (void)path;
    (void)error;
    calls_.fetch_add(1U);
    std::this_thread::sleep_for(delay_);
    exists = true;
    return true;
  }

  std::size_t Calls() const {
    return calls_.load();
  }

private:
  std::chrono::milliseconds delay_;
  std::atomic<std::size_t> calls_{0};
};

// Blocks every probe until Release(), like a mount that stopped answering.
class HangingPathProbe final : public reconcile::IPathProbe {
public:
  bool Probe(const fs::path& path, bool& exists, std::string& error) override {
    (void)path;
    (void)error;
    calls_.fetch_add(1U);
    std::unique_lock<std::mutex> lock(mutex_);
    released_cv_.wait(lock, [this]() { return released_; });
    exists = true;
    return true;
  }

  void Release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      released_ = true;
    }
    released_cv_.notify_all();
  }

  std::size_t Calls() const {
    return calls_.load();
  }

private:
  std::mutex mutex_;
  std::condition_variable released_cv_;
  bool released_ = false;
  std::atomic<std::size_t> calls_{0};
};

class FailingPathProbe final : public reconcile::IPathProbe {
public:
  bool Probe(const fs::path& path, bool& exists, std::string& error) override {
    (void)path;
    exists = false;
    error = "permission denied";
    return false;
  }
};

} // namespace

TEST_CASE("Expected paths follow scene order then the latest output", "[reconcile]") {
  model::Project project = BuildSampleProject("P1", "/art");
  project.checkpoints.back().output_file_path = "/art/mix.wav";
  project.scenes[1].image_file_path = "/art/audio_0.wav";

  const std::vector<std::string> expected = reconcile::CollectExpectedPaths(project);
  REQUIRE(expected == std::vector<std::string>{"/art/audio_0.wav", "/art/image_0.png",
                                               "/art/audio_1.wav", "/art/mix.wav"});
}

TEST_CASE("Incomplete scenes and empty paths are not expected", "[reconcile]") {
  model::Project project = BuildSampleProject("P1", "/art");
  project.scenes[0].is_completed = false;
  project.scenes[1].audio_file_path = "";
  project.scenes[2].audio_file_path = "/art/audio_2.wav";

  REQUIRE(reconcile::CollectExpectedPaths(project) == std::vector<std::string>{"/art/image_1.png"});
}

TEST_CASE("Reconcile reports missing files in expected order", "[reconcile]") {
  ScopedTempDir temp("scenevault-reconcile");
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  const reconcile::FileReconciler reconciler({}, nullptr, logger);

  model::Project project = BuildSampleProject("P1", temp.Path());
  TouchProjectArtifacts(project);
  REQUIRE(reconciler.Reconcile(project).files_exist);

  fs::remove(temp.Path() / "image_0.png");
  fs::remove(temp.Path() / "audio_1.wav");
  const reconcile::ReconcileReport report = reconciler.Reconcile(project);
  REQUIRE_FALSE(report.files_exist);
  REQUIRE(report.missing_files ==
          std::vector<std::string>{(temp.Path() / "image_0.png").string(),
                                   (temp.Path() / "audio_1.wav").string()});
  REQUIRE(report.expected_files.size() == 4U);
  REQUIRE(log.str().find("msg=\"artifact missing\"") != std::string::npos);
}

TEST_CASE("A directory at an artifact path counts as missing", "[reconcile]") {
  ScopedTempDir temp("scenevault-reconcile");
  std::ostringstream log;
  Logger logger(LogLevel::kInfo, log);
  const reconcile::FileReconciler reconciler({}, nullptr, logger);

  model::Project project = BuildSampleProject("P1", temp.Path());
  TouchProjectArtifacts(project);
  fs::remove(temp.Path() / "audio_0.wav");
  fs::create_directories(temp.Path() / "audio_0.wav");

  const reconcile::ReconcileReport report = reconciler.Reconcile(project);
  REQUIRE(report.missing_files == std::vector<std::string>{(temp.Path() / "audio_0.wav").string()});
}

TEST_CASE("Project without checkpoints never reports files present", "[reconcile]") {
  std::ostringstream log;
  Logger logger(LogLevel::kInfo, log);
  const reconcile::FileReconciler reconciler({}, nullptr, logger);

  model::Project project = BuildSampleProject("P1");
  project.checkpoints.clear();
  for (model::Scene& scene : project.scenes) {
    scene.is_completed = false;
  }
  const reconcile::ReconcileReport report = reconciler.Reconcile(project);
  REQUIRE(report.expected_files.empty());
  REQUIRE_FALSE(report.files_exist);
}

TEST_CASE("Relative paths resolve under the artifact root", "[reconcile]") {
  ScopedTempDir temp("scenevault-reconcile");
  std::ostringstream log;
  Logger logger(LogLevel::kInfo, log);
  reconcile::ReconcilerOptions options;
  options.artifact_root = temp.Path();
  const reconcile::FileReconciler reconciler(options, nullptr, logger);

  model::Project project = BuildSampleProject("P1", "job7");
  fs::create_directories(temp.Path() / "job7");
  for (const std::string& path : reconcile::CollectExpectedPaths(project)) {
    WriteStringToFile(temp.Path() / path, "artifact");
  }
  fs::remove(temp.Path() / "job7" / "image_1.png");

  const reconcile::ReconcileReport report = reconciler.Reconcile(project);
  REQUIRE(report.missing_files == std::vector<std::string>{"job7/image_1.png"});
}

TEST_CASE("Slow probe is bounded by the timeout and counts as missing", "[reconcile]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  auto probe = std::make_shared<SlowPathProbe>(std::chrono::milliseconds(300));
  reconcile::ReconcilerOptions options;
  options.probe_timeout = std::chrono::milliseconds(20);
  const reconcile::FileReconciler reconciler(options, probe, logger);

  model::Project project = BuildSampleProject("P1");
  project.scenes[1].is_completed = false;

  const auto started = std::chrono::steady_clock::now();
  const reconcile::ReconcileReport report = reconciler.Reconcile(project);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  REQUIRE_FALSE(report.files_exist);
  REQUIRE(report.missing_files.size() == 2U);
  REQUIRE(elapsed < std::chrono::milliseconds(250));
  REQUIRE(log.str().find("probe timed out after 20ms") != std::string::npos);
}

TEST_CASE("Probe failure counts as missing", "[reconcile]") {
  std::ostringstream log;
  Logger logger(LogLevel::kDebug, log);
  const reconcile::FileReconciler reconciler({}, std::make_shared<FailingPathProbe>(), logger);

  const reconcile::ReconcileReport report = reconciler.Reconcile(BuildSampleProject("P1"));
  REQUIRE(report.missing_files.size() == 4U);
  REQUIRE(log.str().find("reason=\"permission denied\"") != std::string::npos);
}

TEST_CASE("A hung mount never grows the worker count past its cap", "[reconcile]") {
  std::ostringstream log;
  Logger logger(LogLevel::kInfo, log);
  auto probe = std::make_shared<HangingPathProbe>();
  reconcile::ReconcilerOptions options;
  options.probe_timeout = std::chrono::milliseconds(20);
  options.max_probe_workers = 2;
  const reconcile::FileReconciler reconciler(options, probe, logger);

  const model::Project project = BuildSampleProject("P1");
  for (int i = 0; i < 20; ++i) {
    const reconcile::ReconcileReport report = reconciler.Reconcile(project);
    REQUIRE(report.missing_files.size() == 4U);
    REQUIRE(reconciler.LiveProbeWorkers() <= 2U);
  }
  // Tasks abandoned at the deadline are dropped before they run.
  REQUIRE(probe->Calls() <= 2U);

  probe->Release();
  bool recovered = false;
  for (int i = 0; i < 50 && !recovered; ++i) {
    recovered = reconciler.Reconcile(project).files_exist;
  }
  REQUIRE(recovered);
  REQUIRE(reconciler.LiveProbeWorkers() <= 2U);
}

TEST_CASE("Paths of one project are checked concurrently", "[reconcile]") {
  std::ostringstream log;
  Logger logger(LogLevel::kInfo, log);
  auto probe = std::make_shared<SlowPathProbe>(std::chrono::milliseconds(200));
  reconcile::ReconcilerOptions options;
  options.probe_timeout = std::chrono::milliseconds(2000);
  options.max_probe_workers = 4;
  const reconcile::FileReconciler reconciler(options, probe, logger);

  const auto started = std::chrono::steady_clock::now();
  const reconcile::ReconcileReport report = reconciler.Reconcile(BuildSampleProject("P1"));
  const auto elapsed = std::chrono::steady_clock::now() - started;

  REQUIRE(report.files_exist);
  REQUIRE(probe->Calls() == 4U);
  REQUIRE(elapsed < std::chrono::milliseconds(600));
}

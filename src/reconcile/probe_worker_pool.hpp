#pragma once

#include "reconcile/path_probe.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace scenevault::reconcile {

enum class ProbeStatus {
  kExists = 0,
  kMissing,
  kFailed,
  kTimedOut,
};

struct ProbeResult {
  ProbeStatus status = ProbeStatus::kFailed;
  // Probe error text for kFailed; empty otherwise.
  std::string error;
};

// Runs path probes on at most `max_workers` threads shared by every caller.
//
// Workers start lazily and are detached: one stuck on a hung mount keeps its
// slot until the probe returns, and no new thread replaces it. Tasks a caller
// stopped waiting for are dropped from the queue before they reach a probe.
// Destroying the pool releases idle workers; busy ones exit after their
// current probe.
class ProbeWorkerPool {
public:
  ProbeWorkerPool(std::shared_ptr<IPathProbe> probe, std::size_t max_workers);
  ~ProbeWorkerPool();

  ProbeWorkerPool(const ProbeWorkerPool&) = delete;
  ProbeWorkerPool& operator=(const ProbeWorkerPool&) = delete;

  // Probes every path concurrently against one shared deadline `timeout`
  // from now. Results line up with `paths`.
  std::vector<ProbeResult> ProbeAll(const std::vector<std::filesystem::path>& paths,
                                    std::chrono::milliseconds timeout);

  // Worker threads currently alive, idle or busy.
  std::size_t LiveWorkers() const;

  std::size_t MaxWorkers() const {
    return max_workers_;
  }

private:
  struct State;
  struct Task;

  static void RunWorker(const std::shared_ptr<State>& state);
  // Starts workers until queued tasks are covered or the cap is reached.
  // Caller holds the state mutex.
  void SpawnWorkersLocked();

  std::size_t max_workers_ = 1;
  std::shared_ptr<State> state_;
};

} // namespace scenevault::reconcile

#include "reconcile/probe_worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace scenevault::reconcile {

struct ProbeWorkerPool::Task {
  fs::path path;
  std::promise<ProbeResult> promise;
  std::atomic<bool> abandoned{false};
};

struct ProbeWorkerPool::State {
  std::shared_ptr<IPathProbe> probe;
  std::mutex mutex;
  std::condition_variable wake;
  std::deque<std::shared_ptr<Task>> queue;
  std::size_t live_workers = 0;
  std::size_t idle_workers = 0;
  bool stopping = false;
};

ProbeWorkerPool::ProbeWorkerPool(std::shared_ptr<IPathProbe> probe, const std::size_t max_workers)
    : max_workers_(std::max<std::size_t>(max_workers, 1U)), state_(std::make_shared<State>()) {
  state_->probe = std::move(probe);
}

ProbeWorkerPool::~ProbeWorkerPool() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->stopping = true;
    state_->queue.clear();
  }
  state_->wake.notify_all();
}

std::size_t ProbeWorkerPool::LiveWorkers() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->live_workers;
}

void ProbeWorkerPool::RunWorker(const std::shared_ptr<State>& state) {
  for (;;) {
    std::shared_ptr<Task> task;
    {
      std::unique_lock<std::mutex> lock(state->mutex);
      ++state->idle_workers;
      state->wake.wait(lock, [&state]() { return state->stopping || !state->queue.empty(); });
      --state->idle_workers;
      if (state->stopping) {
        --state->live_workers;
        return;
      }
      task = std::move(state->queue.front());
      state->queue.pop_front();
    }
    if (task->abandoned.load()) {
      continue;
    }

    ProbeResult result;
    bool exists = false;
    std::string error;
    try {
      if (!state->probe->Probe(task->path, exists, error)) {
        result.status = ProbeStatus::kFailed;
        result.error = std::move(error);
      } else {
        result.status = exists ? ProbeStatus::kExists : ProbeStatus::kMissing;
      }
    } catch (const std::exception& ex) {
      result.status = ProbeStatus::kFailed;
      result.error = std::string("probe threw: ") + ex.what();
    }
    task->promise.set_value(std::move(result));
  }
}

void ProbeWorkerPool::SpawnWorkersLocked() {
  while (state_->live_workers < max_workers_ && state_->idle_workers < state_->queue.size()) {
    ++state_->live_workers;
    ++state_->idle_workers;
    try {
      std::thread([state = state_]() {
        {
          // Hand the reserved idle slot back; RunWorker counts itself again.
          std::lock_guard<std::mutex> lock(state->mutex);
          --state->idle_workers;
        }
        RunWorker(state);
      }).detach();
    } catch (const std::system_error&) {
      --state_->live_workers;
      --state_->idle_workers;
      return;
    }
  }
}

std::vector<ProbeResult> ProbeWorkerPool::ProbeAll(const std::vector<fs::path>& paths,
                                                   const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  std::vector<std::shared_ptr<Task>> tasks;
  std::vector<std::future<ProbeResult>> futures;
  tasks.reserve(paths.size());
  futures.reserve(paths.size());
  for (const fs::path& path : paths) {
    auto task = std::make_shared<Task>();
    task->path = path;
    futures.push_back(task->promise.get_future());
    tasks.push_back(std::move(task));
  }

  bool have_workers = false;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto& queue = state_->queue;
    queue.erase(std::remove_if(queue.begin(), queue.end(),
                               [](const std::shared_ptr<Task>& queued) {
                                 return queued->abandoned.load();
                               }),
                queue.end());
    queue.insert(queue.end(), tasks.begin(), tasks.end());
    SpawnWorkersLocked();
    have_workers = state_->live_workers > 0U;
  }
  state_->wake.notify_all();

  std::vector<ProbeResult> results(paths.size());
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    if (!have_workers) {
      tasks[i]->abandoned.store(true);
      results[i].status = ProbeStatus::kFailed;
      results[i].error = "failed to start probe worker";
      continue;
    }
    if (futures[i].wait_until(deadline) != std::future_status::ready) {
      tasks[i]->abandoned.store(true);
      results[i].status = ProbeStatus::kTimedOut;
      continue;
    }
    results[i] = futures[i].get();
  }
  return results;
}

} // namespace scenevault::reconcile

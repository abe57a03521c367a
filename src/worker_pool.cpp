#include <textembed/worker_pool.hpp>

#include <textembed/session.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <string>

namespace textembed::internal {

WorkerPool::WorkerPool(size_t num_threads) {
  if (num_threads == 0) num_threads = HardwareThreads();
  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this] { WorkerLoop(); });
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
}

void WorkerPool::Submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void WorkerPool::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
      if (stop_ && queue_.empty()) return;
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    task();
  }
}

Status WorkerPool::ParallelFor(size_t n, const std::function<Status(size_t)>& fn) {
  if (n == 0) return Status::OK();

  struct State {
    std::function<Status(size_t)> fn;
    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::vector<Status> results;
    std::mutex mutex;
    std::condition_variable done_cv;
    size_t running = 0;
  };
  auto state = std::make_shared<State>();
  state->fn = fn;
  state->results.resize(n);

  auto runner = [state, n] {
    while (!state->failed.load()) {
      size_t i = state->next.fetch_add(1);
      if (i >= n) break;
      Status s;
      try {
        s = state->fn(i);
      } catch (const std::exception& e) {
        s = Status::InferenceRuntimeError("Task " + std::to_string(i) +
                                          " threw: " + e.what());
      }
      if (!s.ok()) {
        state->results[i] = std::move(s);
        state->failed.store(true);
      }
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    if (--state->running == 0) state->done_cv.notify_all();
  };

  // One runner per worker plus the caller, never more than there is work.
  const size_t helpers = std::min(n - 1, workers_.size());
  state->running = helpers + 1;
  for (size_t i = 0; i < helpers; ++i) Submit(runner);
  runner();

  {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->done_cv.wait(lock, [&state] { return state->running == 0; });
  }

  for (auto& s : state->results) {
    if (!s.ok()) return s;
  }
  return Status::OK();
}

WorkerPool& SharedWorkerPool() {
  static WorkerPool pool;
  return pool;
}

}  // namespace textembed::internal

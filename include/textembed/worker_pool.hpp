#pragma once

#include <textembed/status.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace textembed::internal {

/**
 * Fixed-size pool of worker threads for independent units of work.
 *
 * Thread-safe: ParallelFor() may be called from several threads at once.
 * It must not be called from inside a task running on the same pool.
 */
class WorkerPool {
 public:
  // 0 = hardware concurrency
  explicit WorkerPool(size_t num_threads = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  size_t size() const { return workers_.size(); }

  /**
   * Run fn(i) for every i in [0, n) and wait for completion. The calling
   * thread takes part in the work.
   *
   * Once a call fails no further indices are started. A call that throws
   * a std::exception fails with kInferenceRuntimeError. Returns the failure
   * with the lowest index, or OK.
   */
  Status ParallelFor(size_t n, const std::function<Status(size_t)>& fn);

 private:
  void Submit(std::function<void()> task);
  void WorkerLoop();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  bool stop_ = false;
  std::vector<std::thread> workers_;
};

/**
 * Process-wide pool sized to the hardware, created on first use.
 */
WorkerPool& SharedWorkerPool();

}  // namespace textembed::internal

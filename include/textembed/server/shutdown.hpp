#pragma once

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace textembed::server {

/**
 * Drains embedding requests before the HTTP loop stops.
 *
 * Lifecycle:
 *   1. Handlers call Admit() for every embedding request and hold the
 *      returned lease until the response is sent.
 *   2. Shutdown() (directly, or from SIGTERM/SIGINT/SIGHUP once
 *      WatchSignals() is active) stops admitting requests, waits for the
 *      leases still out, bounded by the drain timeout, and then runs the
 *      OnShutdown() callbacks in registration order.
 *
 * Signals only write to a self-pipe; the shutdown itself runs on a watcher
 * thread.
 *
 * Thread-safe.
 */
class ShutdownCoordinator {
 public:
  /** Marks one admitted request; releases it when destroyed. */
  class Lease {
   public:
    Lease(Lease&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
    Lease& operator=(Lease&&) = delete;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    ~Lease();

   private:
    friend class ShutdownCoordinator;
    explicit Lease(ShutdownCoordinator* owner) : owner_(owner) {}

    ShutdownCoordinator* owner_;
  };

  explicit ShutdownCoordinator(
      std::chrono::milliseconds drain_timeout = std::chrono::seconds(30));
  ~ShutdownCoordinator();

  ShutdownCoordinator(const ShutdownCoordinator&) = delete;
  ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

  void SetDrainTimeout(std::chrono::milliseconds timeout);

  /** A lease for one request, or nullopt once shutdown has begun. */
  std::optional<Lease> Admit();

  size_t InFlight() const;

  /**
   * Route SIGTERM, SIGINT and SIGHUP to Shutdown().
   * Only one coordinator per process can watch signals; returns false if
   * another one does or the handlers cannot be installed.
   */
  bool WatchSignals();

  /** Restore the previous signal handlers and stop the watcher thread. */
  void StopWatchingSignals();

  /**
   * Stop admitting, drain, then run callbacks.
   * Returns false if another call already performed the shutdown.
   */
  bool Shutdown();

  bool IsDraining() const;

  /** False if the last drain gave up with requests still in flight. */
  bool DrainedCleanly() const;

  void OnShutdown(std::function<void()> callback);

  /** Block until the callbacks have run. */
  void WaitForShutdown();

 private:
  void Release();
  static void HandleSignal(int signum);

  mutable std::mutex mutex_;
  std::condition_variable cv_;  // in-flight count and completion changes
  std::vector<std::function<void()>> callbacks_;
  std::chrono::milliseconds drain_timeout_;
  size_t in_flight_ = 0;
  bool draining_ = false;
  bool complete_ = false;
  bool drained_cleanly_ = true;

  std::thread watcher_;
  int pipe_[2] = {-1, -1};
  struct sigaction old_sigterm_;
  struct sigaction old_sigint_;
  struct sigaction old_sighup_;
};

/** Process-wide coordinator used by the server. */
ShutdownCoordinator& GlobalShutdownCoordinator();

}  // namespace textembed::server

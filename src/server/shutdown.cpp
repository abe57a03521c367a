#include <textembed/server/shutdown.hpp>

#include <trantor/utils/Logger.h>

#include <atomic>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace textembed::server {

namespace {
// Write end of the self-pipe of the coordinator that watches signals.
std::atomic<int> g_signal_fd{-1};
}  // namespace

ShutdownCoordinator::Lease::~Lease() {
  if (owner_) owner_->Release();
}

ShutdownCoordinator::ShutdownCoordinator(std::chrono::milliseconds drain_timeout)
    : drain_timeout_(drain_timeout) {}

ShutdownCoordinator::~ShutdownCoordinator() {
  StopWatchingSignals();
}

void ShutdownCoordinator::SetDrainTimeout(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  drain_timeout_ = timeout;
}

std::optional<ShutdownCoordinator::Lease> ShutdownCoordinator::Admit() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (draining_) return std::nullopt;
  ++in_flight_;
  return Lease(this);
}

void ShutdownCoordinator::Release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
  }
  cv_.notify_all();
}

size_t ShutdownCoordinator::InFlight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_;
}

void ShutdownCoordinator::HandleSignal(int signum) {
  // Only async-signal-safe calls here.
  int saved_errno = errno;
  int fd = g_signal_fd.load();
  if (fd >= 0) {
    unsigned char byte = static_cast<unsigned char>(signum);
    ssize_t n = write(fd, &byte, 1);
    (void)n;
  }
  errno = saved_errno;
}

bool ShutdownCoordinator::WatchSignals() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (watcher_.joinable()) return true;

  int fds[2];
  if (pipe(fds) != 0) return false;
  fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  fcntl(fds[1], F_SETFD, FD_CLOEXEC);

  int expected = -1;
  if (!g_signal_fd.compare_exchange_strong(expected, fds[1])) {
    close(fds[0]);
    close(fds[1]);
    return false;
  }

  struct sigaction sa;
  sa.sa_handler = HandleSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;

  bool installed = sigaction(SIGTERM, &sa, &old_sigterm_) == 0;
  if (installed && sigaction(SIGINT, &sa, &old_sigint_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    installed = false;
  }
  if (installed && sigaction(SIGHUP, &sa, &old_sighup_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    installed = false;
  }
  if (!installed) {
    g_signal_fd.store(-1);
    close(fds[0]);
    close(fds[1]);
    return false;
  }

  pipe_[0] = fds[0];
  pipe_[1] = fds[1];
  int read_fd = fds[0];
  watcher_ = std::thread([this, read_fd] {
    for (;;) {
      unsigned char byte = 0;
      ssize_t n = read(read_fd, &byte, 1);
      if (n < 0 && errno == EINTR) continue;
      // Zero is the stop request from StopWatchingSignals().
      if (n <= 0 || byte == 0) return;
      LOG_INFO << "Received signal " << static_cast<int>(byte)
               << ", shutting down";
      Shutdown();
    }
  });
  return true;
}

void ShutdownCoordinator::StopWatchingSignals() {
  std::thread watcher;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!watcher_.joinable()) return;
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    sigaction(SIGHUP, &old_sighup_, nullptr);
    g_signal_fd.store(-1);

    unsigned char stop = 0;
    ssize_t n = write(pipe_[1], &stop, 1);
    (void)n;
    watcher = std::move(watcher_);
  }
  // The watcher may be inside Shutdown(), which takes mutex_.
  if (watcher.get_id() != std::this_thread::get_id()) {
    watcher.join();
  } else {
    watcher.detach();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  close(pipe_[0]);
  close(pipe_[1]);
  pipe_[0] = pipe_[1] = -1;
}

bool ShutdownCoordinator::Shutdown() {
  std::vector<std::function<void()>> callbacks;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (draining_) {
      cv_.wait(lock, [this] { return complete_; });
      return false;
    }
    draining_ = true;

    if (in_flight_ > 0) {
      LOG_INFO << "Draining " << in_flight_ << " in-flight request(s)";
    }
    drained_cleanly_ =
        cv_.wait_for(lock, drain_timeout_, [this] { return in_flight_ == 0; });
    if (!drained_cleanly_) {
      LOG_WARN << "Drain timeout after " << drain_timeout_.count() << " ms with "
               << in_flight_ << " request(s) still in flight";
    }
    callbacks = callbacks_;
  }

  for (auto& callback : callbacks) {
    if (callback) callback();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    complete_ = true;
  }
  cv_.notify_all();
  return true;
}

bool ShutdownCoordinator::IsDraining() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return draining_;
}

bool ShutdownCoordinator::DrainedCleanly() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return drained_cleanly_;
}

void ShutdownCoordinator::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ShutdownCoordinator::WaitForShutdown() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return complete_; });
}

ShutdownCoordinator& GlobalShutdownCoordinator() {
  static ShutdownCoordinator instance;
  return instance;
}

}  // namespace textembed::server

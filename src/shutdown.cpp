#include <ragrank/shutdown.hpp>

#include <ragrank/retriever.hpp>

#include <algorithm>
#include <cerrno>
#include <iostream>

#include <fcntl.h>
#include <unistd.h>

namespace ragrank {

namespace {
// Write end of the owning handler's pipe; -1 when no handler owns the signals.
std::atomic<int> g_signal_fd{-1};

constexpr unsigned char kStopWatcher = 0;
}  // namespace

ShutdownHandler::ShutdownHandler() = default;

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
  Shutdown();
}

void ShutdownHandler::RegisterRetriever(Retriever* retriever) {
  if (!retriever) return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(retrievers_.begin(), retrievers_.end(), retriever) == retrievers_.end()) {
    retrievers_.push_back(retriever);
  }
}

void ShutdownHandler::UnregisterRetriever(Retriever* retriever) {
  if (!retriever) return;

  std::lock_guard<std::mutex> lock(mutex_);
  retrievers_.erase(std::remove(retrievers_.begin(), retrievers_.end(), retriever),
                    retrievers_.end());
}

void ShutdownHandler::SignalHandler(int signum) {
  const int saved_errno = errno;
  const int fd = g_signal_fd.load();
  if (fd >= 0) {
    const unsigned char byte = static_cast<unsigned char>(signum);
    const ssize_t n = write(fd, &byte, 1);  // best effort in signal context
    (void)n;
  }
  errno = saved_errno;
}

void ShutdownHandler::WatchSignals() {
  for (;;) {
    unsigned char byte = kStopWatcher;
    const ssize_t n = read(pipe_fds_[0], &byte, 1);
    if (n < 0 && errno == EINTR) continue;
    if (n != 1 || byte == kStopWatcher) return;

    last_signal_.store(byte);
    Shutdown();
    return;
  }
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_installed_) return true;

  if (pipe(pipe_fds_) != 0) {
    std::cerr << "ragrank: shutdown pipe failed: errno " << errno << "\n";
    pipe_fds_[0] = pipe_fds_[1] = -1;
    return false;
  }
  fcntl(pipe_fds_[1], F_SETFL, fcntl(pipe_fds_[1], F_GETFL) | O_NONBLOCK);

  int expected = -1;
  if (!g_signal_fd.compare_exchange_strong(expected, pipe_fds_[1])) {
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    pipe_fds_[0] = pipe_fds_[1] = -1;
    return false;
  }

  struct sigaction sa;
  sa.sa_handler = SignalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;

  bool ok = sigaction(SIGTERM, &sa, &old_sigterm_) == 0;
  if (ok && sigaction(SIGINT, &sa, &old_sigint_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    ok = false;
  }
  if (ok && sigaction(SIGHUP, &sa, &old_sighup_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    ok = false;
  }
  if (!ok) {
    g_signal_fd.store(-1);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    pipe_fds_[0] = pipe_fds_[1] = -1;
    return false;
  }

  watcher_ = std::thread(&ShutdownHandler::WatchSignals, this);
  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::thread watcher;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handlers_installed_) return;

    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    sigaction(SIGHUP, &old_sighup_, nullptr);
    g_signal_fd.store(-1);

    const unsigned char stop = kStopWatcher;
    if (write(pipe_fds_[1], &stop, 1) != 1) {
      // Closing the write end also ends the watcher's read.
      close(pipe_fds_[1]);
      pipe_fds_[1] = -1;
    }
    watcher = std::move(watcher_);
    handlers_installed_ = false;
  }

  if (watcher.joinable()) {
    if (watcher.get_id() == std::this_thread::get_id()) {
      watcher.detach();
      return;
    }
    watcher.join();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  for (int& fd : pipe_fds_) {
    if (fd >= 0) close(fd);
    fd = -1;
  }
}

bool ShutdownHandler::Shutdown() {
  bool expected = false;
  if (!shutdown_requested_.compare_exchange_strong(expected, true)) {
    WaitForShutdown();
    return false;
  }

  std::vector<Retriever*> retrievers;
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    retrievers.swap(retrievers_);
    callbacks = callbacks_;
  }

  for (Retriever* retriever : retrievers) {
    retriever->Close();
  }
  for (const auto& callback : callbacks) {
    if (callback) callback();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_complete_.store(true);
  }
  done_cv_.notify_all();
  return true;
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ShutdownHandler::WaitForShutdown() {
  std::unique_lock<std::mutex> lock(mutex_);
  done_cv_.wait(lock, [this] { return shutdown_complete_.load(); });
}

ShutdownHandler& GlobalShutdownHandler() {
  static ShutdownHandler instance;
  return instance;
}

}  // namespace ragrank

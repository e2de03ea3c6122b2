#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace ragrank {

class Retriever;

/**
 * ShutdownHandler closes registered retrievers on SIGTERM/SIGINT/SIGHUP.
 *
 * The signal handler only writes the signal number to a pipe; a watcher
 * thread reads it and runs Shutdown(), so Retriever::Close() never runs in
 * signal context. At most one handler per process owns the signals.
 *
 * Example:
 *   ragrank::ShutdownHandler shutdown_handler;
 *   shutdown_handler.InstallSignalHandlers();
 *   shutdown_handler.RegisterRetriever(retriever.get());
 *   shutdown_handler.WaitForShutdown();
 */
class ShutdownHandler {
 public:
  ShutdownHandler();
  ~ShutdownHandler();

  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /** The retriever must stay valid until unregistered or shut down. */
  void RegisterRetriever(Retriever* retriever);

  void UnregisterRetriever(Retriever* retriever);

  /**
   * Install handlers for SIGTERM, SIGINT and SIGHUP and start the watcher
   * thread. False if another handler already owns the signals or a system
   * call fails.
   */
  bool InstallSignalHandlers();

  /** Restore the previous handlers and stop the watcher. */
  void RestoreSignalHandlers();

  /**
   * Close all registered retrievers, then run callbacks in registration
   * order. Idempotent; a concurrent second caller waits for the first.
   * Returns true if this call performed the shutdown.
   */
  bool Shutdown();

  bool IsShutdownRequested() const { return shutdown_requested_.load(); }

  /** Signal that triggered shutdown (0 if none). */
  int LastSignal() const { return last_signal_.load(); }

  void OnShutdown(std::function<void()> callback);

  /** Block until Shutdown() has completed. */
  void WaitForShutdown();

 private:
  static void SignalHandler(int signum);
  void WatchSignals();

  std::mutex mutex_;
  std::condition_variable done_cv_;
  std::vector<Retriever*> retrievers_;
  std::vector<std::function<void()>> callbacks_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> shutdown_complete_{false};
  std::atomic<int> last_signal_{0};

  bool handlers_installed_ = false;
  int pipe_fds_[2] = {-1, -1};
  std::thread watcher_;

  struct sigaction old_sigterm_;
  struct sigaction old_sigint_;
  struct sigaction old_sighup_;
};

/** Process-wide handler for single-instance deployments. */
ShutdownHandler& GlobalShutdownHandler();

}  // namespace ragrank

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace ragrank::internal {

using Clock = std::chrono::steady_clock;

/**
 * Fixed-size worker pool with an unbounded FIFO queue.
 *
 * The worker count is the concurrency bound for adapter and reranker calls.
 * Tasks must not wait on other tasks of the same pool. A future that is
 * abandoned (deadline passed) does not block on destruction; the task still
 * runs to completion and must own everything it touches.
 */
class BoundedExecutor {
 public:
  explicit BoundedExecutor(size_t num_threads);

  /** Stops accepting work, drains the queue and joins the workers. */
  ~BoundedExecutor();

  BoundedExecutor(const BoundedExecutor&) = delete;
  BoundedExecutor& operator=(const BoundedExecutor&) = delete;

  /** Returns an invalid future if the executor is stopped. */
  template <typename F>
  auto Submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>&>>;

  /** Stop accepting work, finish queued tasks and join. Idempotent. */
  void Shutdown();

  size_t NumThreads() const { return workers_.size(); }
  size_t QueueDepth() const;
  bool IsStopped() const;

 private:
  void WorkerLoop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_ = false;
};

template <typename F>
auto BoundedExecutor::Submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
  using R = std::invoke_result_t<std::decay_t<F>&>;

  auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
  std::future<R> result = task->get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) return std::future<R>();
    tasks_.emplace([task]() { (*task)(); });
  }
  cv_.notify_one();
  return result;
}

/**
 * Wait for a future until deadline (no deadline = wait indefinitely).
 * False if the future is invalid or not ready in time.
 */
template <typename T>
bool ReadyBy(const std::future<T>& f, const std::optional<Clock::time_point>& deadline) {
  if (!f.valid()) return false;
  if (!deadline) {
    f.wait();
    return true;
  }
  return f.wait_until(*deadline) == std::future_status::ready;
}

}  // namespace ragrank::internal

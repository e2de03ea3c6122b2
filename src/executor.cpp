#include <ragrank/executor.hpp>

#include <algorithm>

namespace ragrank::internal {

BoundedExecutor::BoundedExecutor(size_t num_threads) {
  const size_t n = std::max<size_t>(num_threads, 1);
  workers_.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    workers_.emplace_back([this]() { WorkerLoop(); });
  }
}

BoundedExecutor::~BoundedExecutor() { Shutdown(); }

void BoundedExecutor::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ && workers_.empty()) return;
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& w : workers_) {
    if (w.joinable()) w.join();
  }
  workers_.clear();
}

size_t BoundedExecutor::QueueDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

bool BoundedExecutor::IsStopped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopping_;
}

void BoundedExecutor::WorkerLoop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
      if (tasks_.empty()) return;  // stopping and drained
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    task();
  }
}

}  // namespace ragrank::internal

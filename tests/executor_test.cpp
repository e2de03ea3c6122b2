// Tests for the bounded worker pool and deadline waits

#include <gtest/gtest.h>

#include <ragrank/executor.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

namespace ragrank::internal {
namespace {

using namespace std::chrono_literals;

TEST(BoundedExecutorTest, RunsTasksAndReturnsValues) {
  BoundedExecutor pool(2);
  EXPECT_EQ(pool.NumThreads(), 2u);

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 10; ++i) {
    futures.push_back(pool.Submit([i]() { return i * i; }));
  }
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(futures[i].get(), i * i);
  }
}

TEST(BoundedExecutorTest, ZeroThreadsMeansOne) {
  BoundedExecutor pool(0);
  EXPECT_EQ(pool.NumThreads(), 1u);
  EXPECT_EQ(pool.Submit([]() { return 7; }).get(), 7);
}

TEST(BoundedExecutorTest, NeverExceedsWorkerCount) {
  BoundedExecutor pool(3);
  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  std::vector<std::future<void>> futures;
  for (int i = 0; i < 12; ++i) {
    futures.push_back(pool.Submit([&]() {
      int now = running.fetch_add(1) + 1;
      int prev = peak.load();
      while (now > prev && !peak.compare_exchange_weak(prev, now)) {
      }
      std::this_thread::sleep_for(5ms);
      running.fetch_sub(1);
    }));
  }
  for (auto& f : futures) f.get();
  EXPECT_LE(peak.load(), 3);
  EXPECT_GE(peak.load(), 1);
}

TEST(BoundedExecutorTest, ExceptionsPropagateThroughFuture) {
  BoundedExecutor pool(1);
  auto f = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(f.get(), std::runtime_error);
  // Worker survives.
  EXPECT_EQ(pool.Submit([]() { return 1; }).get(), 1);
}

TEST(BoundedExecutorTest, ShutdownDrainsQueueAndRejectsNewWork) {
  BoundedExecutor pool(1);
  std::atomic<int> done{0};
  std::vector<std::future<void>> futures;
  for (int i = 0; i < 5; ++i) {
    futures.push_back(pool.Submit([&]() {
      std::this_thread::sleep_for(2ms);
      done.fetch_add(1);
    }));
  }

  pool.Shutdown();
  EXPECT_EQ(done.load(), 5);
  EXPECT_TRUE(pool.IsStopped());
  EXPECT_EQ(pool.QueueDepth(), 0u);

  auto rejected = pool.Submit([]() { return 1; });
  EXPECT_FALSE(rejected.valid());

  pool.Shutdown();  // idempotent
}

// =============================================================================
// ReadyBy
// =============================================================================

TEST(ReadyByTest, NoDeadlineWaitsForCompletion) {
  BoundedExecutor pool(1);
  auto f = pool.Submit([]() {
    std::this_thread::sleep_for(20ms);
    return 3;
  });
  EXPECT_TRUE(ReadyBy(f, std::nullopt));
  EXPECT_EQ(f.get(), 3);
}

TEST(ReadyByTest, PassedDeadlineReportsNotReady) {
  BoundedExecutor pool(1);
  std::promise<void> release;
  auto gate = release.get_future().share();
  auto f = pool.Submit([gate]() {
    gate.wait();
    return 1;
  });

  const auto start = Clock::now();
  EXPECT_FALSE(ReadyBy(f, Clock::now() + 20ms));
  EXPECT_LT(Clock::now() - start, 2s);

  release.set_value();
  EXPECT_TRUE(ReadyBy(f, Clock::now() + 2s));
}

TEST(ReadyByTest, InvalidFutureIsNeverReady) {
  std::future<int> invalid;
  EXPECT_FALSE(ReadyBy(invalid, std::nullopt));
  EXPECT_FALSE(ReadyBy(invalid, Clock::now() + 1s));
}

}  // namespace
}  // namespace ragrank::internal

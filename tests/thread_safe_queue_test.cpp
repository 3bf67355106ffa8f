// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for barsim::ThreadSafeQueue<T> and barsim::WorkerPool.
//
// Validates:
//   - FIFO order
//   - Blocking pop() wakes on push and on close()
//   - close(): pushes rejected, queued items still drained
//   - WorkerPool: results through futures, exceptions through futures,
//     queued jobs finished before the pool is destroyed
//
// Threading model:
//   Threads spawned here are joined before assertions, so a failing test
//   leaves nothing running.
// =============================================================================

#include "barsim/concurrent/thread_safe_queue.hpp"
#include "barsim/concurrent/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  barsim::ThreadSafeQueue<int> queue;
};

TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  for (int i = 0; i < 50; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  for (int i = 0; i < 50; ++i) {
    auto item = queue.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, i) << "FIFO violated at index " << i;
  }
}

// -----------------------------------------------------------------------------
// Blocking pop() must wait until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};
  std::thread consumer([this, &received] {
    auto item = queue.pop();
    received.store(item ? *item : -2);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();
  EXPECT_EQ(received.load(), 77) << "consumer did not see the pushed value";
}

// -----------------------------------------------------------------------------
// close() wakes every blocked consumer with nullopt.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, CloseWakesBlockedConsumers) {
  constexpr int kConsumers = 3;
  std::atomic<int> woke_empty{0};
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, &woke_empty] {
      if (!queue.pop().has_value()) {
        woke_empty.fetch_add(1);
      }
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.close();
  for (auto& t : consumers) t.join();

  EXPECT_EQ(woke_empty.load(), kConsumers);
  EXPECT_FALSE(queue.push(1));
}

TEST_F(ThreadSafeQueueTest, CloseRejectsPushButDrainsQueuedItems) {
  queue.push(1);
  queue.push(2);
  queue.close();

  EXPECT_FALSE(queue.push(3));
  EXPECT_EQ(queue.pop(), std::optional<int>(1));
  EXPECT_EQ(queue.pop(), std::optional<int>(2));
  EXPECT_FALSE(queue.pop().has_value());
}

// -----------------------------------------------------------------------------
// Several producers and consumers: every pushed item is delivered once.
// Each consumer tallies what it saw; the tallies must add up to exactly one
// per item.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EveryItemDeliveredExactlyOnce) {
  constexpr int kThreadsPerSide = 3;
  constexpr int kPerProducer = 2000;
  constexpr int kItems = kThreadsPerSide * kPerProducer;

  std::vector<std::atomic<int>> seen(kItems);
  for (auto& s : seen) s.store(0);

  std::vector<std::thread> threads;
  for (int c = 0; c < kThreadsPerSide; ++c) {
    threads.emplace_back([this, &seen] {
      while (const auto item = queue.pop()) {
        seen[static_cast<std::size_t>(*item)].fetch_add(1);
      }
    });
  }

  std::vector<std::thread> writers;
  for (int p = 0; p < kThreadsPerSide; ++p) {
    writers.emplace_back([this, p] {
      for (int n = 0; n < kPerProducer; ++n) {
        ASSERT_TRUE(queue.push(n * kThreadsPerSide + p));
      }
    });
  }
  for (auto& w : writers) w.join();

  queue.close();
  for (auto& t : threads) t.join();

  int missing = 0;
  int duplicated = 0;
  for (const auto& s : seen) {
    if (s.load() == 0) ++missing;
    if (s.load() > 1) ++duplicated;
  }
  EXPECT_EQ(missing, 0);
  EXPECT_EQ(duplicated, 0);
}

// =============================================================================
// WorkerPool
// =============================================================================

TEST(WorkerPoolTest, FuturesDeliverResultsInSubmissionOrder) {
  barsim::WorkerPool pool(4);

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 32; ++i) {
    futures.push_back(pool.submit([i] { return i * i; }));
  }
  for (int i = 0; i < 32; ++i) {
    EXPECT_EQ(futures[i].get(), i * i);
  }
}

TEST(WorkerPoolTest, JobExceptionSurfacesThroughFuture) {
  barsim::WorkerPool pool(2);
  auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
  auto fine = pool.submit([] { return 5; });

  EXPECT_THROW(failing.get(), std::runtime_error);
  // The worker survived the failing job.
  EXPECT_EQ(fine.get(), 5);
}

TEST(WorkerPoolTest, DestructorFinishesQueuedJobs) {
  std::atomic<int> done{0};
  {
    barsim::WorkerPool pool(1);
    for (int i = 0; i < 10; ++i) {
      pool.submit([&done] {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        done.fetch_add(1);
      });
    }
  }
  EXPECT_EQ(done.load(), 10);
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
  // A pool with no workers would never run this job.
  barsim::WorkerPool pool(0);
  EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

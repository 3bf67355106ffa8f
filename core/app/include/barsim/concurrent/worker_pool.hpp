#pragma once

#include "barsim/concurrent/thread_safe_queue.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace barsim {

// -----------------------------------------------------------------------------
// WorkerPool — fixed-size pool of threads executing submitted jobs
// -----------------------------------------------------------------------------
//
// @brief  Runs independent shard simulations concurrently. Each submit()
//         returns a std::future for the job's result.
//
// @details
// Jobs travel through a ThreadSafeQueue<std::function<void()>>. Every worker
// loops on the blocking pop() until the queue is closed and drained.
//
// Exceptions thrown by a job are captured by its std::packaged_task and
// rethrown from future::get() on the caller's thread; a failing job never
// takes a worker thread down.
//
// Lifecycle:
//   Constructor spawns the threads. The destructor closes the queue, lets
//   the workers finish every job already queued, and joins them. Futures
//   obtained earlier therefore always become ready.
//
// Ownership:
//   Owns its threads and queue. Non-copyable, non-movable.
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  // A size of 0 is treated as 1.
  explicit WorkerPool(std::size_t n_threads) {
    if (n_threads == 0) {
      n_threads = 1;
    }
    workers_.reserve(n_threads);
    for (std::size_t i = 0; i < n_threads; ++i) {
      workers_.emplace_back([this]() { workerLoop(); });
    }
  }

  ~WorkerPool() {
    jobs_.close();
    for (auto& worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // -------------------------------------------------------------------------
  // submit(fn)
  // -------------------------------------------------------------------------
  // @brief  Queues fn for execution on some worker thread.
  //
  // @return Future holding fn's result, or the exception it threw.
  //
  // @throws std::runtime_error if the pool is shutting down.
  // -------------------------------------------------------------------------
  template <typename F>
  auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;

    // std::function needs a copyable callable; packaged_task is move-only.
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    std::future<R> result = task->get_future();

    if (!jobs_.push([task]() { (*task)(); })) {
      throw std::runtime_error("WorkerPool: submit after shutdown");
    }
    return result;
  }

 private:
  void workerLoop() {
    while (auto job = jobs_.pop()) {
      (*job)();
    }
  }

  ThreadSafeQueue<std::function<void()>> jobs_;
  std::vector<std::thread> workers_;
};

}  // namespace barsim

#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace barsim {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Closable FIFO shared between the thread that submits shard
// jobs and the WorkerPool threads that execute them. Multiple producers and
// multiple consumers.
//
// Lifecycle: open → closed. After close(), push() is rejected and pop()
// drains the remaining items, then returns std::nullopt to every waiter.
// That nullopt is the workers' signal to exit.
//
// Thread model: All methods are thread-safe.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // Mutex and condition_variable are neither copyable nor movable; share
  // the queue by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends one item and wakes one waiting consumer.
  // Output: false if the queue is already closed (the item is dropped).
  // -------------------------------------------------------------------------
  bool push(T value) {
    {
      std::lock_guard lock(mutex_);
      if (closed_) {
        return false;
      }
      queue_.push_back(std::move(value));
    }
    // Notify outside the lock so the woken thread can take the mutex at once.
    condition_.notify_one();
    return true;
  }

  // -------------------------------------------------------------------------
  // pop() — blocking
  // -------------------------------------------------------------------------
  // Waits until an item is available or the queue is closed. Returns the
  // front item, or std::nullopt once the queue is closed AND empty. Items
  // pushed before close() are still delivered.
  // -------------------------------------------------------------------------
  std::optional<T> pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // close()
  // -------------------------------------------------------------------------
  // Rejects further pushes and wakes every blocked pop(). Idempotent.
  // -------------------------------------------------------------------------
  void close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    condition_.notify_all();
  }

 private:
  // Guards queue_ and closed_.
  mutable std::mutex mutex_;

  // Signalled on push (one waiter) and on close (all waiters).
  std::condition_variable condition_;

  std::deque<T> queue_;
  bool closed_{false};
};

}  // namespace barsim

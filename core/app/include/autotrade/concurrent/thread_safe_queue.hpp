#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace autotrade {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between producer and consumer threads.
// Engine loops push broadcast events here; the ZmqBroadcaster worker drains
// them and does the JSON serialization and socket I/O off the trading path.
//
// Thread model: Multiple producers, multiple consumers. Every method locks
// mutex_; blocking pop() waits on condition_ until an item is present.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // What: Appends one item and wakes one blocked consumer.
  // Thread-safety: Any thread. The notify happens after the lock is released.
  // -------------------------------------------------------------------------
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // What: Removes and returns the front item, waiting until one exists.
  // The predicate form of wait() absorbs spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // try_pop(): non-blocking
  // -------------------------------------------------------------------------
  // Output: the front item, or std::nullopt when the queue is empty.
  // -------------------------------------------------------------------------
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // drain()
  // -------------------------------------------------------------------------
  // What: Moves every queued item out in FIFO order under a single lock.
  // Used by consumers that flush in batches (ZmqBroadcaster::publishPending).
  // -------------------------------------------------------------------------
  std::vector<T> drain() {
    std::lock_guard lock(mutex_);
    std::vector<T> items;
    items.reserve(queue_.size());
    for (auto& item : queue_) {
      items.push_back(std::move(item));
    }
    queue_.clear();
    return items;
  }

  // Snapshot only; another thread may change the queue right after.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace autotrade

#pragma once

#include <mutex>
#include <optional>

namespace autotrade {

// -----------------------------------------------------------------------------
// LatestValue<T>
// -----------------------------------------------------------------------------
//
// @brief  Single-slot mailbox: writers overwrite, the reader takes the most
//         recent value at most once.
//
// @details
// Bridges push-style order book subscriptions into the QuoteEngine cycle.
// The feed callback calls store() on the feed thread; the engine calls
// take() at the start of each cycle and falls back to a pull when nothing
// new arrived. Intermediate snapshots are dropped on purpose: a quoting
// decision only ever needs the newest book.
//
// Thread-safety: All methods lock mutex_ and may be called from any thread.
// -----------------------------------------------------------------------------
template <typename T>
class LatestValue {
 public:
  LatestValue() = default;

  LatestValue(const LatestValue&) = delete;
  LatestValue& operator=(const LatestValue&) = delete;

  void store(T value) {
    std::lock_guard lock(mutex_);
    value_ = std::move(value);
  }

  std::optional<T> take() {
    std::lock_guard lock(mutex_);
    std::optional<T> out = std::move(value_);
    value_.reset();
    return out;
  }

  void clear() {
    std::lock_guard lock(mutex_);
    value_.reset();
  }

 private:
  std::mutex mutex_;
  std::optional<T> value_;
};

}  // namespace autotrade

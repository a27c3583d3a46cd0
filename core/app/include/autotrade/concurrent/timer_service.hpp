#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace autotrade {

// -----------------------------------------------------------------------------
// TimerService
// -----------------------------------------------------------------------------
//
// @brief  One-shot timers executed on a dedicated thread, each identified by
//         a TimerId that can be cancelled before it fires.
//
// @details
// QuoteEngine arms one timer per quoted side to pull the order after the
// cancel interval. Timers are tracked explicitly so stop() can drop all of
// them; anything still pending at destruction is discarded, never run.
//
// Deadlines use std::chrono::steady_clock, not ITimeProvider: a timer is a
// real-time resource-release mechanism, not a simulated event.
//
// Cancellation contract:
//   cancel() and cancelAll() remove pending timers and return immediately.
//   They do NOT wait for a callback that is already executing. Owners that
//   need "no effect after stop" pair the timer with their own token check
//   inside the callback (QuoteEngine uses run generation + quote sequence).
//   This keeps cancelAll() safe to call while holding a lock that an
//   executing callback is waiting on.
//
// Thread model:
//   schedule/cancel/cancelAll/pending are safe from any thread, including
//   from inside a timer callback. Callbacks run on the timer thread without
//   mutex_ held. A callback that throws std::exception is logged and the
//   service keeps running.
// -----------------------------------------------------------------------------
class TimerService {
 public:
  using TimerId = std::uint64_t;
  using Callback = std::function<void()>;

  // Spawns the timer thread.
  explicit TimerService(std::string name);

  // Stops the thread; pending timers are discarded.
  ~TimerService();

  TimerService(const TimerService&) = delete;
  TimerService& operator=(const TimerService&) = delete;
  TimerService(TimerService&&) = delete;
  TimerService& operator=(TimerService&&) = delete;

  // -------------------------------------------------------------------------
  // schedule(delay, callback)
  // -------------------------------------------------------------------------
  // @brief  Arms a one-shot timer.
  // @return Id for cancel(). Ids are never reused by this instance.
  // -------------------------------------------------------------------------
  TimerId schedule(std::chrono::milliseconds delay, Callback callback);

  // @return true if the timer was still pending and is now removed.
  bool cancel(TimerId id);

  void cancelAll();

  std::size_t pending() const;

 private:
  struct Entry {
    std::chrono::steady_clock::time_point due;
    Callback callback;
  };

  void run();

  const std::string name_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<TimerId, Entry> timers_;
  TimerId next_id_{1};
  bool running_{true};

  // Declared last: started after every other member is initialized.
  std::thread thread_;
};

}  // namespace autotrade

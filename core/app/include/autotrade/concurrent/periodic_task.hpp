#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace autotrade {

// -----------------------------------------------------------------------------
// PeriodicTask
// -----------------------------------------------------------------------------
//
// @brief  Owns one worker thread that invokes a tick callback repeatedly,
//         sleeping between ticks for whatever delay the tick returns.
//
// @details
// This is the scheduling primitive behind QuoteEngine (normal cadence vs
// error backoff) and ExecutionOrchestrator (fixed interval). The tick runs
// immediately after start(); afterwards the worker waits on stop_cv_ so a
// stop() request cuts the inter-cycle delay short instead of waiting it out.
//
// Self-stop:
//   A tick may end up calling stop() on its own task (a risk pause stops the
//   user's engines from inside a cycle). Joining the current thread would
//   deadlock, so in that case stop() only clears running_ and returns; the
//   thread is joined by the next start(), stop() from another thread, or the
//   destructor.
//
// Thread model:
//   start() and stop() may be called from any thread and are serialized on
//   lifecycle_mutex_, except the self-stop path which takes no lock.
//
// Ownership:
//   The tick callback typically captures the owning engine by pointer. The
//   owner must stop the task before its own members are destroyed.
// -----------------------------------------------------------------------------
class PeriodicTask {
 public:
  // Returns the delay before the next tick.
  using Tick = std::function<std::chrono::milliseconds()>;

  explicit PeriodicTask(std::string name);

  // RAII: stops and joins the worker.
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&) = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;
  PeriodicTask(PeriodicTask&&) = delete;
  PeriodicTask& operator=(PeriodicTask&&) = delete;

  // -------------------------------------------------------------------------
  // start(tick)
  // -------------------------------------------------------------------------
  // @brief  Spawns the worker. Returns false (and does nothing) if the task
  //         is already running.
  //
  // @details
  // A worker that was self-stopped but not yet joined is joined first.
  // Exceptions escaping the tick are not caught here; callers own their
  // error boundary and return a backoff delay instead of throwing.
  // -------------------------------------------------------------------------
  bool start(Tick tick);

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Requests exit, wakes the worker and joins it.
  //
  // Thread-safety: Any thread. Idempotent. From the worker itself the call
  //                does not join (see class comment).
  // -------------------------------------------------------------------------
  void stop();

  bool running() const { return running_.load(); }

  const std::string& name() const { return name_; }

 private:
  void run();

  const std::string name_;
  Tick tick_;

  std::atomic<bool> running_{false};

  std::mutex lifecycle_mutex_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  std::thread thread_;
};

}  // namespace autotrade

#include "autotrade/concurrent/timer_service.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace autotrade {

TimerService::TimerService(std::string name)
    : name_(std::move(name)), thread_([this] { run(); }) {}

// -----------------------------------------------------------------------------
// Destructor: stop the thread, discard whatever is still pending
// -----------------------------------------------------------------------------
TimerService::~TimerService() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
    timers_.clear();
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

TimerService::TimerId TimerService::schedule(std::chrono::milliseconds delay,
                                             Callback callback) {
  TimerId id = 0;
  {
    std::lock_guard lock(mutex_);
    id = next_id_++;
    timers_.emplace(id, Entry{std::chrono::steady_clock::now() + delay,
                              std::move(callback)});
  }
  // The new timer may be due earlier than the one the thread sleeps on.
  cv_.notify_all();
  return id;
}

bool TimerService::cancel(TimerId id) {
  std::lock_guard lock(mutex_);
  return timers_.erase(id) > 0;
}

void TimerService::cancelAll() {
  std::lock_guard lock(mutex_);
  timers_.clear();
}

std::size_t TimerService::pending() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

// -----------------------------------------------------------------------------
// run(): timer thread
// -----------------------------------------------------------------------------
void TimerService::run() {
  std::unique_lock lock(mutex_);

  while (running_) {
    if (timers_.empty()) {
      cv_.wait(lock, [this] { return !running_ || !timers_.empty(); });
      continue;
    }

    // At most a handful of timers per engine: linear scan for the earliest.
    auto earliest = std::min_element(
        timers_.begin(), timers_.end(), [](const auto& a, const auto& b) {
          return a.second.due < b.second.due;
        });

    const auto due = earliest->second.due;
    if (std::chrono::steady_clock::now() < due) {
      // Woken early by schedule()/cancel()/shutdown: re-evaluate.
      cv_.wait_until(lock, due);
      continue;
    }

    Callback callback = std::move(earliest->second.callback);
    timers_.erase(earliest);

    lock.unlock();
    try {
      callback();
    } catch (const std::exception& e) {
      std::cerr << "[TimerService] " << name_
                << " callback failed: " << e.what() << "\n";
    }
    lock.lock();
  }
}

}  // namespace autotrade

#include "autotrade/concurrent/periodic_task.hpp"

#include <iostream>

namespace autotrade {

namespace {

// Task whose tick is executing on the current thread, if any. Lets stop()
// recognise a call coming from inside its own worker without reading
// thread_ (which start() may be reassigning concurrently).
thread_local const PeriodicTask* current_task = nullptr;

}  // namespace

PeriodicTask::PeriodicTask(std::string name) : name_(std::move(name)) {}

// -----------------------------------------------------------------------------
// Destructor: join the worker before members go away
// -----------------------------------------------------------------------------
PeriodicTask::~PeriodicTask() {
  stop();
  // A self-stopped worker is still joinable here.
  std::lock_guard lock(lifecycle_mutex_);
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
bool PeriodicTask::start(Tick tick) {
  std::lock_guard lock(lifecycle_mutex_);
  if (running_.load()) {
    return false;
  }

  // Left over from a self-stop: the old worker has exited or is about to.
  if (thread_.joinable()) {
    thread_.join();
  }

  tick_ = std::move(tick);
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  return true;
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void PeriodicTask::stop() {
  if (current_task == this) {
    running_.store(false);
    stop_cv_.notify_all();
    return;
  }

  std::lock_guard lock(lifecycle_mutex_);
  running_.store(false);
  stop_cv_.notify_all();

  // No lock the worker needs is held across join(): the worker never takes
  // lifecycle_mutex_.
  if (thread_.joinable()) {
    thread_.join();
  }
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void PeriodicTask::run() {
  current_task = this;

  while (running_.load()) {
    const std::chrono::milliseconds delay = tick_();

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, delay, [this] { return !running_.load(); });
  }

  current_task = nullptr;
  std::cout << "[PeriodicTask] " << name_ << " exited.\n";
}

}  // namespace autotrade

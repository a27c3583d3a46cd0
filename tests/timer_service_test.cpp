// =============================================================================
// timer_service_test.cpp
// =============================================================================
// Unit tests for autotrade::TimerService.
//
// Validates:
//   - A scheduled callback fires once after its delay
//   - cancel() before the deadline prevents the callback
//   - cancelAll() drops every pending timer
//   - Earlier deadlines fire first even when scheduled later
//   - A throwing callback does not kill the timer thread
//   - Pending timers are discarded on destruction
// =============================================================================

#include "autotrade/concurrent/timer_service.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class TimerServiceTest : public ::testing::Test {
 protected:
  autotrade::TimerService timers{"test-timers"};
};

// -----------------------------------------------------------------------------
// 1. schedule() fires the callback after the delay.
// -----------------------------------------------------------------------------
TEST_F(TimerServiceTest, ScheduledCallbackFires) {
  std::promise<void> fired;
  auto future = fired.get_future();

  const auto id = timers.schedule(10ms, [&] { fired.set_value(); });

  EXPECT_GT(id, 0u);
  EXPECT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_EQ(timers.pending(), 0u);
}

// -----------------------------------------------------------------------------
// 2. cancel() before the deadline prevents the callback.
// Why: QuoteEngine cancels the other side's timer when one side's timer
//      already pulled the quote.
// -----------------------------------------------------------------------------
TEST_F(TimerServiceTest, CancelPreventsCallback) {
  std::atomic<bool> fired{false};
  const auto id = timers.schedule(200ms, [&] { fired.store(true); });

  EXPECT_EQ(timers.pending(), 1u);
  EXPECT_TRUE(timers.cancel(id));
  EXPECT_FALSE(timers.cancel(id));  // already gone

  std::this_thread::sleep_for(300ms);
  EXPECT_FALSE(fired.load());
}

// -----------------------------------------------------------------------------
// 3. cancelAll() clears everything.
// -----------------------------------------------------------------------------
TEST_F(TimerServiceTest, CancelAllDropsPendingTimers) {
  std::atomic<int> fired{0};
  for (int i = 0; i < 5; ++i) {
    timers.schedule(200ms, [&] { ++fired; });
  }
  EXPECT_EQ(timers.pending(), 5u);

  timers.cancelAll();
  EXPECT_EQ(timers.pending(), 0u);

  std::this_thread::sleep_for(300ms);
  EXPECT_EQ(fired.load(), 0);
}

// -----------------------------------------------------------------------------
// 4. A later-scheduled shorter timer fires before an earlier longer one.
// Why: The thread sleeps on the earliest deadline; schedule() must wake it
//      to re-evaluate.
// -----------------------------------------------------------------------------
TEST_F(TimerServiceTest, EarliestDeadlineFiresFirst) {
  std::mutex mutex;
  std::vector<int> order;
  std::promise<void> both;
  auto future = both.get_future();

  auto record = [&](int tag) {
    std::lock_guard lock(mutex);
    order.push_back(tag);
    if (order.size() == 2) {
      both.set_value();
    }
  };

  timers.schedule(300ms, [&] { record(1); });
  timers.schedule(20ms, [&] { record(2); });

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  std::lock_guard lock(mutex);
  EXPECT_EQ(order, (std::vector<int>{2, 1}));
}

// -----------------------------------------------------------------------------
// 5. A throwing callback is logged and later timers still fire.
// -----------------------------------------------------------------------------
TEST_F(TimerServiceTest, ThrowingCallbackDoesNotStopService) {
  std::promise<void> fired;
  auto future = fired.get_future();

  timers.schedule(5ms, [] { throw std::runtime_error("boom"); });
  timers.schedule(30ms, [&] { fired.set_value(); });

  EXPECT_EQ(future.wait_for(2s), std::future_status::ready);
}

// -----------------------------------------------------------------------------
// 6. A callback may schedule another timer.
// Why: Callbacks run without the service lock; re-entry must not deadlock.
// -----------------------------------------------------------------------------
TEST_F(TimerServiceTest, CallbackCanScheduleAnotherTimer) {
  std::promise<void> second;
  auto future = second.get_future();

  timers.schedule(5ms, [&] {
    timers.schedule(5ms, [&] { second.set_value(); });
  });

  EXPECT_EQ(future.wait_for(2s), std::future_status::ready);
}

// -----------------------------------------------------------------------------
// 7. Destruction discards pending timers without running them.
// -----------------------------------------------------------------------------
TEST(TimerServiceLifetimeTest, DestructorDiscardsPending) {
  std::atomic<bool> fired{false};
  {
    autotrade::TimerService local("scoped");
    local.schedule(100ms, [&] { fired.store(true); });
  }
  std::this_thread::sleep_for(200ms);
  EXPECT_FALSE(fired.load());
}

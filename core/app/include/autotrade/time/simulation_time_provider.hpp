#pragma once

#include "autotrade/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace autotrade {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" only moves when told to.
//
// @details
// Tests use it to age quotes past the cancel interval, expire the risk pause
// cooldown, cross a calendar day for the daily-loss rollover and trigger
// time-to-live exits without sleeping. ZmqOrderbookFeed can also drive it
// from snapshot timestamps when replaying recorded books.
//
// Internal storage is a single std::atomic<int64_t>: one writer (the test
// or the replay feed) and many reader threads, no mutex on the read path.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to an absolute timestamp.
  //
  // @details
  // Monotonicity is the caller's responsibility; setting an earlier time is
  // allowed and occasionally useful in tests.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms (atomic read-modify-write).
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace autotrade

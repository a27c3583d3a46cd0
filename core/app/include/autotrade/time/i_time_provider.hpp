#pragma once

#include <cstdint>

namespace autotrade {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" for every component that stamps, ages or throttles
//         anything: quote age, pause cooldowns, daily-loss rollover, exit
//         monitor throttling, trade and log timestamps.
//
// @details
// Components receive `const ITimeProvider&` and never read the system clock
// themselves. Production wiring injects LiveTimeProvider; tests inject
// SimulationTimeProvider and move time explicitly, which makes cooldowns,
// day boundaries and time-to-live exits deterministic.
//
// All values are epoch milliseconds. The record store, the ZeroMQ payloads
// and the JSON config all carry the same integer representation.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace autotrade

#pragma once

#include <chrono>
#include <cstdint>

namespace autotrade {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Helpers around the engine's epoch-millisecond timestamps.
//
// Thread-safety: Stateless; safe from any thread.
// -----------------------------------------------------------------------------

using Timestamp = std::chrono::system_clock::time_point;

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// local_day_key(ms)
// -------------------------------------------------------------------------
// @brief  Local calendar date of an epoch-millisecond timestamp, encoded as
//         yyyymmdd (e.g. 20240315).
//
// @details
// RiskManager compares day keys to decide when the daily loss window rolls
// over. Two timestamps share a key exactly when they fall on the same local
// date, so the boundary is local midnight.
// -------------------------------------------------------------------------
std::int32_t local_day_key(std::int64_t ms);

}  // namespace autotrade

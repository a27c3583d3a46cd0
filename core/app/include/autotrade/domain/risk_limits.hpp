#pragma once

#include <cstdint>

namespace autotrade {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: process-wide RiskManager parameters
// -----------------------------------------------------------------------------
//
// @brief  Thresholds that are not per-user settings: how many consecutive
//         failures trip the breaker, how long a risk pause lasts, and the
//         fallbacks used when canTrade() gets no price information.
//
// @details
// Loaded from the "risk" section of the config file; the environment
// variables MAX_CONSECUTIVE_FAILURES and RISK_PAUSE_MINUTES override it.
// Copied by value into RiskManager at construction.
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Consecutive failed trades that trigger a risk pause.
  int max_consecutive_failures{5};

  /// How long a risk pause blocks trading, measured from the last failure.
  std::int64_t pause_cooldown_ms{30 * 60 * 1000};

  /// Adverse move assumed for per-trade risk when the caller passes none.
  double default_adverse_move{0.01};

  /// Notional per unit of size used when no mid price is available.
  double flat_notional_per_unit{1000.0};
};

}  // namespace domain
}  // namespace autotrade

#pragma once

#include "autotrade/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace autotrade {
namespace domain {

// -----------------------------------------------------------------------------
// Position: net per-symbol exposure of one user
// -----------------------------------------------------------------------------
//
// @details
// Sign convention for net_quantity: positive long, negative short, zero flat.
// average_price is the weighted entry cost of the open quantity; it resets to
// the fill price when the position reverses through zero. realized_pnl
// accumulates closed quantity × (exit − entry) in the position's direction.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double net_quantity{0.0};
  double average_price{0.0};
  double realized_pnl{0.0};
};

// -----------------------------------------------------------------------------
// OpenPosition: an entry with exit parameters, watched by the exit monitor
// -----------------------------------------------------------------------------
//
// @details
// Created by the order collaborator when an entry order that carries a
// stop-loss, take-profit or time-to-live is filled. Removed when closed.
// -----------------------------------------------------------------------------
struct OpenPosition {
  std::string id;
  std::string symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  double entry_price{0.0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  std::int64_t opened_at_ms{0};
  std::optional<std::int64_t> ttl_ms;
};

}  // namespace domain
}  // namespace autotrade

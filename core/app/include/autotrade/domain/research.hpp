#pragma once

#include "autotrade/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace autotrade {
namespace domain {

enum class Signal {
  Buy,
  Sell,
  Hold,
};

// -----------------------------------------------------------------------------
// ResearchResult: output of one research pass over a symbol
// -----------------------------------------------------------------------------
// accuracy is the provider's confidence in [0, 1]. The orchestrator compares
// it with the user's min_accuracy_threshold before it considers executing.
// -----------------------------------------------------------------------------
struct ResearchResult {
  std::string symbol;
  Signal signal{Signal::Hold};
  double accuracy{0.0};
  std::string recommended_action;
  double orderbook_imbalance{0.0};
  double spread_pct{0.0};
  std::int64_t timestamp_ms{0};
};

enum class TradeAction {
  Buy,
  Sell,
  Hold,
};

// -----------------------------------------------------------------------------
// TradeDecision: what a strategy wants done
// -----------------------------------------------------------------------------
// A Hold decision carries the strategy's reason. price is the reference price
// the strategy decided at; slippage is measured against it.
// -----------------------------------------------------------------------------
struct TradeDecision {
  TradeAction action{TradeAction::Hold};
  OrderType order_type{OrderType::Market};
  double quantity{0.0};
  double price{0.0};
  std::optional<std::string> reason;
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  std::optional<std::int64_t> ttl_ms;
};

inline bool isActionable(const TradeDecision& d) {
  return d.action != TradeAction::Hold;
}

inline Side toSide(TradeAction a) {
  return a == TradeAction::Sell ? Side::Sell : Side::Buy;
}

}  // namespace domain
}  // namespace autotrade

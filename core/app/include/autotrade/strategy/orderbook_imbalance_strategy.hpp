#pragma once

#include "autotrade/strategy/i_strategy.hpp"
#include "autotrade/strategy/i_strategy_runner.hpp"

namespace autotrade {

// -----------------------------------------------------------------------------
// OrderbookImbalanceStrategy: follows the research signal at the touch
// -----------------------------------------------------------------------------
//
// @brief  BUY signal → market buy at the best ask; SELL → market sell at the
//         best bid; HOLD or a one-sided book → Hold with a reason.
//
// @details
// Size is the configured quote size. When the config carries stop-loss /
// take-profit percentages or a position TTL, the decision carries the
// corresponding absolute levels so the gateway opens an exit-tracked
// position.
// -----------------------------------------------------------------------------
class OrderbookImbalanceStrategy final : public IStrategy {
 public:
  static constexpr const char* kName = "orderbook_imbalance";

  explicit OrderbookImbalanceStrategy(StrategyConfig config);

  std::optional<domain::TradeDecision> decide(
      const domain::ResearchResult& research,
      const domain::Orderbook& orderbook) override;

 private:
  const StrategyConfig config_;
};

}  // namespace autotrade

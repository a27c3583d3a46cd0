#include "autotrade/strategy/orderbook_imbalance_strategy.hpp"

#include <utility>

namespace autotrade {

OrderbookImbalanceStrategy::OrderbookImbalanceStrategy(StrategyConfig config)
    : config_(std::move(config)) {}

std::optional<domain::TradeDecision> OrderbookImbalanceStrategy::decide(
    const domain::ResearchResult& research,
    const domain::Orderbook& orderbook) {
  domain::TradeDecision decision;

  if (research.signal == domain::Signal::Hold) {
    decision.reason = "Strategy returned HOLD";
    return decision;
  }

  const auto best_bid = orderbook.bestBid();
  const auto best_ask = orderbook.bestAsk();
  if (!best_bid || !best_ask) {
    decision.reason = "Orderbook has no two-sided market";
    return decision;
  }

  const bool buy = research.signal == domain::Signal::Buy;
  decision.action = buy ? domain::TradeAction::Buy : domain::TradeAction::Sell;
  decision.order_type = domain::OrderType::Market;
  decision.quantity = config_.quote_size;
  decision.price = buy ? *best_ask : *best_bid;

  // Stop below entry for a long, above for a short; take-profit mirrored.
  const double dir = buy ? 1.0 : -1.0;
  if (config_.stop_loss_pct) {
    decision.stop_loss =
        decision.price * (1.0 - dir * *config_.stop_loss_pct / 100.0);
  }
  if (config_.take_profit_pct) {
    decision.take_profit =
        decision.price * (1.0 + dir * *config_.take_profit_pct / 100.0);
  }
  decision.ttl_ms = config_.position_ttl_ms;
  decision.reason = research.recommended_action;
  return decision;
}

}  // namespace autotrade

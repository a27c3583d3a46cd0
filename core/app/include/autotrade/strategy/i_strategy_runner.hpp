#pragma once

#include "autotrade/domain/orderbook.hpp"
#include "autotrade/domain/research.hpp"
#include "autotrade/execution/i_order_gateway.hpp"
#include "autotrade/market/i_market_data_source.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace autotrade {

// -----------------------------------------------------------------------------
// StrategyConfig: parameters handed to a strategy at initialization
// -----------------------------------------------------------------------------
struct StrategyConfig {
  std::string symbol;
  double quote_size{0.001};
  double adverse_pct{0.0002};
  std::int64_t cancel_ms{40};
  double max_position{0.01};
  std::optional<double> stop_loss_pct;
  std::optional<double> take_profit_pct;
  std::optional<std::int64_t> position_ttl_ms;
};

// -----------------------------------------------------------------------------
// IStrategyRunner: named, per-user strategy instances
// -----------------------------------------------------------------------------
//
// @brief  Initializes and runs strategies by name on behalf of a user.
//
// @details
// initializeStrategy() throws StrategyAlreadyInitializedError when the
// (user, name) pair already has an instance, and std::invalid_argument for an
// unknown name. executeStrategy() returns std::nullopt when the strategy has
// no opinion; it throws std::logic_error if the strategy was never
// initialized for the user.
//
// Thread model: Safe for concurrent calls from different users' loops.
// -----------------------------------------------------------------------------
class IStrategyRunner {
 public:
  virtual ~IStrategyRunner() = default;

  virtual void initializeStrategy(const std::string& user_id,
                                  const std::string& name,
                                  const StrategyConfig& config,
                                  IMarketDataSource& market,
                                  IOrderGateway& orders) = 0;

  virtual std::optional<domain::TradeDecision> executeStrategy(
      const std::string& user_id, const std::string& name,
      const domain::ResearchResult& research,
      const domain::Orderbook& orderbook) = 0;
};

}  // namespace autotrade

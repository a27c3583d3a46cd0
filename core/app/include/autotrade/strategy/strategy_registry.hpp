#pragma once

#include "autotrade/strategy/i_strategy.hpp"
#include "autotrade/strategy/i_strategy_runner.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace autotrade {

// -----------------------------------------------------------------------------
// StrategyRegistry: IStrategyRunner over named strategy factories
// -----------------------------------------------------------------------------
//
// @brief  Maps strategy names to factories and keeps one instance per
//         (user, strategy name).
//
// @details
// The default constructor registers the built-in "orderbook_imbalance"
// strategy. Further strategies are added with registerFactory() before any
// engine starts.
//
// Thread model:
//   mutex_ guards the factory and instance maps. executeStrategy() copies
//   the instance's shared_ptr under the lock and runs decide() outside it,
//   so one user's slow strategy never blocks another user's lookup.
// -----------------------------------------------------------------------------
class StrategyRegistry final : public IStrategyRunner {
 public:
  using Factory = std::function<std::unique_ptr<IStrategy>(
      const StrategyConfig&, IMarketDataSource&, IOrderGateway&)>;

  StrategyRegistry();

  StrategyRegistry(const StrategyRegistry&) = delete;
  StrategyRegistry& operator=(const StrategyRegistry&) = delete;

  // Replaces an existing factory with the same name.
  void registerFactory(const std::string& name, Factory factory);

  bool isInitialized(const std::string& user_id,
                     const std::string& name) const;

  std::vector<std::string> registeredNames() const;

  // --- IStrategyRunner ------------------------------------------------------
  void initializeStrategy(const std::string& user_id, const std::string& name,
                          const StrategyConfig& config,
                          IMarketDataSource& market,
                          IOrderGateway& orders) override;

  std::optional<domain::TradeDecision> executeStrategy(
      const std::string& user_id, const std::string& name,
      const domain::ResearchResult& research,
      const domain::Orderbook& orderbook) override;

 private:
  using InstanceKey = std::pair<std::string, std::string>;

  mutable std::mutex mutex_;
  std::map<std::string, Factory> factories_;
  std::map<InstanceKey, std::shared_ptr<IStrategy>> instances_;
};

}  // namespace autotrade

#include "autotrade/strategy/strategy_registry.hpp"
#include "autotrade/domain/errors.hpp"
#include "autotrade/strategy/orderbook_imbalance_strategy.hpp"

#include <iostream>
#include <stdexcept>

namespace autotrade {

StrategyRegistry::StrategyRegistry() {
  registerFactory(OrderbookImbalanceStrategy::kName,
                  [](const StrategyConfig& config, IMarketDataSource&,
                     IOrderGateway&) -> std::unique_ptr<IStrategy> {
                    return std::make_unique<OrderbookImbalanceStrategy>(config);
                  });
}

void StrategyRegistry::registerFactory(const std::string& name,
                                       Factory factory) {
  std::lock_guard lock(mutex_);
  factories_[name] = std::move(factory);
}

bool StrategyRegistry::isInitialized(const std::string& user_id,
                                     const std::string& name) const {
  std::lock_guard lock(mutex_);
  return instances_.count(InstanceKey{user_id, name}) > 0;
}

std::vector<std::string> StrategyRegistry::registeredNames() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> names;
  for (const auto& [name, factory] : factories_) {
    names.push_back(name);
  }
  return names;
}

// -----------------------------------------------------------------------------
// initializeStrategy
// -----------------------------------------------------------------------------
void StrategyRegistry::initializeStrategy(const std::string& user_id,
                                          const std::string& name,
                                          const StrategyConfig& config,
                                          IMarketDataSource& market,
                                          IOrderGateway& orders) {
  Factory factory;
  {
    std::lock_guard lock(mutex_);
    if (instances_.count(InstanceKey{user_id, name}) > 0) {
      throw StrategyAlreadyInitializedError("Strategy " + name +
                                            " already initialized for user " +
                                            user_id);
    }
    auto it = factories_.find(name);
    if (it == factories_.end()) {
      throw std::invalid_argument("Unknown strategy: " + name);
    }
    factory = it->second;
  }

  std::shared_ptr<IStrategy> instance = factory(config, market, orders);

  std::lock_guard lock(mutex_);
  // Lost a race with a concurrent initialization of the same pair.
  auto [it, inserted] =
      instances_.emplace(InstanceKey{user_id, name}, std::move(instance));
  if (!inserted) {
    throw StrategyAlreadyInitializedError("Strategy " + name +
                                          " already initialized for user " +
                                          user_id);
  }

  std::cout << "[StrategyRegistry] initialized " << name
            << " user=" << user_id << " symbol=" << config.symbol << "\n";
}

// -----------------------------------------------------------------------------
// executeStrategy
// -----------------------------------------------------------------------------
std::optional<domain::TradeDecision> StrategyRegistry::executeStrategy(
    const std::string& user_id, const std::string& name,
    const domain::ResearchResult& research,
    const domain::Orderbook& orderbook) {
  std::shared_ptr<IStrategy> instance;
  {
    std::lock_guard lock(mutex_);
    auto it = instances_.find(InstanceKey{user_id, name});
    if (it == instances_.end()) {
      throw std::logic_error("Strategy " + name +
                             " not initialized for user " + user_id);
    }
    instance = it->second;
  }
  return instance->decide(research, orderbook);
}

}  // namespace autotrade

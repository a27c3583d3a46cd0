// =============================================================================
// strategy_registry_test.cpp
// =============================================================================
// Unit tests for autotrade::StrategyRegistry and the built-in
// OrderbookImbalanceStrategy.
//
// Validates:
//   - The built-in strategy is registered by default
//   - Double initialization throws StrategyAlreadyInitializedError
//   - Unknown names and uninitialized execution are rejected
//   - Instances are per user
//   - Decisions: side, touch price, size, SL/TP/TTL, HOLD reasons
// =============================================================================

#include "autotrade/domain/errors.hpp"
#include "autotrade/strategy/orderbook_imbalance_strategy.hpp"
#include "autotrade/strategy/strategy_registry.hpp"
#include "test_doubles.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using autotrade::domain::ResearchResult;
using autotrade::domain::Signal;
using autotrade::domain::TradeAction;

namespace {

ResearchResult research(Signal signal) {
  ResearchResult r;
  r.symbol = "BTCUSDT";
  r.signal = signal;
  r.accuracy = 0.9;
  r.recommended_action = "Execute trade";
  return r;
}

}  // namespace

class StrategyRegistryTest : public ::testing::Test {
 protected:
  StrategyRegistryTest() {
    config.symbol = "BTCUSDT";
    config.quote_size = 0.02;
  }

  autotrade::StrategyRegistry registry;
  autotrade::test::FakeMarket market;
  autotrade::test::RecordingGateway orders;
  autotrade::StrategyConfig config;
};

// -----------------------------------------------------------------------------
// 1. The default registry knows orderbook_imbalance.
// -----------------------------------------------------------------------------
TEST_F(StrategyRegistryTest, BuiltInStrategyIsRegistered) {
  const auto names = registry.registeredNames();
  EXPECT_NE(std::find(names.begin(), names.end(), "orderbook_imbalance"),
            names.end());
  EXPECT_FALSE(registry.isInitialized("alice", "orderbook_imbalance"));
}

// -----------------------------------------------------------------------------
// 2. Initializing the same (user, strategy) twice throws the dedicated error.
// Why: The orchestrator initializes on every cycle and tolerates exactly this
//      error; any other failure must stay distinguishable.
// -----------------------------------------------------------------------------
TEST_F(StrategyRegistryTest, SecondInitializationThrows) {
  registry.initializeStrategy("alice", "orderbook_imbalance", config, market,
                              orders);
  EXPECT_TRUE(registry.isInitialized("alice", "orderbook_imbalance"));

  EXPECT_THROW(registry.initializeStrategy("alice", "orderbook_imbalance",
                                           config, market, orders),
               autotrade::StrategyAlreadyInitializedError);

  // Another user gets an independent instance.
  EXPECT_NO_THROW(registry.initializeStrategy("bob", "orderbook_imbalance",
                                              config, market, orders));
}

// -----------------------------------------------------------------------------
// 3. Unknown names and uninitialized execution are errors.
// -----------------------------------------------------------------------------
TEST_F(StrategyRegistryTest, UnknownOrUninitializedStrategyIsRejected) {
  EXPECT_THROW(registry.initializeStrategy("alice", "martingale", config,
                                           market, orders),
               std::invalid_argument);
  EXPECT_THROW(registry.executeStrategy("alice", "orderbook_imbalance",
                                        research(Signal::Buy),
                                        autotrade::test::makeBook(
                                            "BTCUSDT", 100.0, 101.0)),
               std::logic_error);
}

// -----------------------------------------------------------------------------
// 4. registerFactory() adds a custom strategy that receives the config.
// -----------------------------------------------------------------------------
TEST_F(StrategyRegistryTest, CustomFactoryIsUsed) {
  class AlwaysSell : public autotrade::IStrategy {
   public:
    explicit AlwaysSell(double qty) : qty_(qty) {}
    std::optional<autotrade::domain::TradeDecision> decide(
        const ResearchResult&, const autotrade::domain::Orderbook&) override {
      autotrade::domain::TradeDecision d;
      d.action = TradeAction::Sell;
      d.quantity = qty_;
      d.price = 1.0;
      return d;
    }

   private:
    double qty_;
  };

  registry.registerFactory(
      "always_sell",
      [](const autotrade::StrategyConfig& c, autotrade::IMarketDataSource&,
         autotrade::IOrderGateway&) -> std::unique_ptr<autotrade::IStrategy> {
        return std::make_unique<AlwaysSell>(c.quote_size);
      });

  registry.initializeStrategy("alice", "always_sell", config, market, orders);
  const auto decision = registry.executeStrategy(
      "alice", "always_sell", research(Signal::Hold),
      autotrade::test::makeBook("BTCUSDT", 100.0, 101.0));

  ASSERT_TRUE(decision.has_value());
  EXPECT_EQ(decision->action, TradeAction::Sell);
  EXPECT_DOUBLE_EQ(decision->quantity, 0.02);
}

// -----------------------------------------------------------------------------
// 5. BUY signal → market buy at the best ask with exit levels.
// Scenario: ask 101, SL 1 %, TP 2 % → SL 99.99, TP 103.02.
// -----------------------------------------------------------------------------
TEST(OrderbookImbalanceStrategyTest, BuyAtAskWithExitLevels) {
  autotrade::StrategyConfig cfg;
  cfg.quote_size = 0.05;
  cfg.stop_loss_pct = 1.0;
  cfg.take_profit_pct = 2.0;
  cfg.position_ttl_ms = 60'000;
  autotrade::OrderbookImbalanceStrategy strategy(cfg);

  const auto d = strategy.decide(research(Signal::Buy),
                                 autotrade::test::makeBook("BTCUSDT", 100.0,
                                                           101.0));

  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->action, TradeAction::Buy);
  EXPECT_EQ(d->order_type, autotrade::domain::OrderType::Market);
  EXPECT_DOUBLE_EQ(d->price, 101.0);
  EXPECT_DOUBLE_EQ(d->quantity, 0.05);
  EXPECT_NEAR(*d->stop_loss, 99.99, 1e-9);
  EXPECT_NEAR(*d->take_profit, 103.02, 1e-9);
  EXPECT_EQ(d->ttl_ms, std::optional<std::int64_t>(60'000));
  EXPECT_EQ(d->reason, std::optional<std::string>("Execute trade"));
}

// -----------------------------------------------------------------------------
// 6. SELL signal → market sell at the best bid; exits mirrored.
// -----------------------------------------------------------------------------
TEST(OrderbookImbalanceStrategyTest, SellAtBidWithMirroredExits) {
  autotrade::StrategyConfig cfg;
  cfg.stop_loss_pct = 1.0;
  cfg.take_profit_pct = 2.0;
  autotrade::OrderbookImbalanceStrategy strategy(cfg);

  const auto d = strategy.decide(research(Signal::Sell),
                                 autotrade::test::makeBook("BTCUSDT", 100.0,
                                                           101.0));

  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->action, TradeAction::Sell);
  EXPECT_DOUBLE_EQ(d->price, 100.0);
  EXPECT_NEAR(*d->stop_loss, 101.0, 1e-9);
  EXPECT_NEAR(*d->take_profit, 98.0, 1e-9);
  EXPECT_FALSE(d->ttl_ms.has_value());
}

// -----------------------------------------------------------------------------
// 7. HOLD signal or a one-sided book → Hold with a reason.
// -----------------------------------------------------------------------------
TEST(OrderbookImbalanceStrategyTest, HoldCases) {
  autotrade::OrderbookImbalanceStrategy strategy(autotrade::StrategyConfig{});

  auto d = strategy.decide(research(Signal::Hold),
                           autotrade::test::makeBook("BTCUSDT", 100.0, 101.0));
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->action, TradeAction::Hold);
  EXPECT_EQ(d->reason, std::optional<std::string>("Strategy returned HOLD"));

  autotrade::domain::Orderbook one_sided;
  one_sided.bids.push_back({100.0, 1.0});
  d = strategy.decide(research(Signal::Buy), one_sided);
  ASSERT_TRUE(d.has_value());
  EXPECT_FALSE(autotrade::domain::isActionable(*d));
  EXPECT_EQ(d->reason,
            std::optional<std::string>("Orderbook has no two-sided market"));
}

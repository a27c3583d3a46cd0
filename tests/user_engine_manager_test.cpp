// =============================================================================
// user_engine_manager_test.cpp
// =============================================================================
// Tests for autotrade::UserEngineManager.
//
// Validates:
//   - createUserEngine() rejects an empty user and missing collaborators
//   - Creating again replaces (and stops) the previous engine pair
//   - Start/cycle calls for unknown users fail with ConfigurationError
//   - Status reflects the quote loop and the auto-trade loop separately
//   - stopUserEngine() is idempotent and a no-op for unknown users
//   - A risk pause stops the user's engines through IEngineLifecycle, both
//     from a manual cycle and from an engine's own worker thread
// =============================================================================

#include "autotrade/domain/errors.hpp"
#include "autotrade/engine/user_engine_manager.hpp"
#include "autotrade/risk/risk_manager.hpp"
#include "autotrade/store/in_memory_record_store.hpp"
#include "autotrade/time/simulation_time_provider.hpp"
#include "test_doubles.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <thread>

using autotrade::domain::EngineStatus;
using autotrade::domain::Signal;
using namespace std::chrono_literals;

// =============================================================================
// Fixture: one fully wired user "u" trading BTCUSDT.
// =============================================================================
class UserEngineManagerTest : public ::testing::Test {
 protected:
  UserEngineManagerTest() : risk(store, gateway, clock) {
    store.putSettings("u", autotrade::domain::TradingSettings{});
    market.setBook(autotrade::test::bookAroundMid("BTCUSDT", 50000.0, 10.0));
    research.set(Signal::Buy, 0.9);

    collaborators.market = &market;
    collaborators.feed = &market;
    collaborators.orders = &gateway;
    collaborators.positions = &gateway;
    collaborators.accounts = &gateway;
    collaborators.research = &research;
    collaborators.strategies = &strategies;
    collaborators.broadcast = &sink;

    config.symbol = "BTCUSDT";
    config.quote_size = 0.001;
    config.cancel_interval_ms = 60'000;
    config.max_position_size = 0.01;
  }

  std::unique_ptr<autotrade::UserEngineManager> makeManager(
      autotrade::Drive drive = autotrade::Drive::Manual) {
    autotrade::QuoteEngineOptions quote_options;
    quote_options.loop_interval = 10ms;
    auto manager = std::make_unique<autotrade::UserEngineManager>(
        risk, store, clock, quote_options, autotrade::OrchestratorOptions{},
        drive);
    risk.setEngineLifecycle(manager.get());
    return manager;
  }

  void tripBreaker(const std::string& user) {
    for (int i = 0; i < 5; ++i) {
      risk.recordTradeResult(user, 0.0, false);
    }
  }

  autotrade::InMemoryRecordStore store;
  autotrade::test::RecordingGateway gateway;
  autotrade::SimulationTimeProvider clock{1'000'000};
  autotrade::RiskManager risk;
  autotrade::test::FakeMarket market;
  autotrade::test::FixedResearch research;
  autotrade::test::ScriptedStrategies strategies;
  autotrade::test::RecordingSink sink;
  autotrade::UserCollaborators collaborators;
  autotrade::EngineConfig config;
};

// -----------------------------------------------------------------------------
// 1. createUserEngine() validation.
// -----------------------------------------------------------------------------
// Why: every required collaborator is dereferenced by the engines; a missing
// one has to fail at creation, not on the first cycle.
// -----------------------------------------------------------------------------
TEST_F(UserEngineManagerTest, CreateValidatesArguments) {
  auto manager = makeManager();

  EXPECT_THROW(manager->createUserEngine("", collaborators),
               autotrade::ConfigurationError);

  autotrade::UserCollaborators missing = collaborators;
  missing.research = nullptr;
  EXPECT_THROW(manager->createUserEngine("u", missing),
               autotrade::ConfigurationError);

  missing = collaborators;
  missing.feed = nullptr;
  missing.positions = nullptr;
  EXPECT_NO_THROW(manager->createUserEngine("u", missing));

  EXPECT_TRUE(manager->getUserEngineStatus("u").has_engine);
  EXPECT_FALSE(manager->getUserEngineStatus("nobody").has_engine);
}

// -----------------------------------------------------------------------------
// 2. Operations on a user without an engine.
// -----------------------------------------------------------------------------
TEST_F(UserEngineManagerTest, UnknownUserFailsWithConfigurationError) {
  auto manager = makeManager();

  try {
    manager->startQuoting("ghost", config);
    FAIL() << "expected ConfigurationError";
  } catch (const autotrade::ConfigurationError& e) {
    EXPECT_STREQ(e.what(), "No engine for user ghost");
  }
  EXPECT_THROW(manager->startAutoTrade("ghost", "BTCUSDT", 100ms),
               autotrade::ConfigurationError);
  EXPECT_THROW(manager->runCycle("ghost"), autotrade::ConfigurationError);

  EXPECT_NO_FATAL_FAILURE(manager->stopUserEngine("ghost"));
}

// -----------------------------------------------------------------------------
// 3. Status tracks both loops independently.
// -----------------------------------------------------------------------------
TEST_F(UserEngineManagerTest, StatusTracksQuotingAndAutoTrade) {
  auto manager = makeManager();
  manager->createUserEngine("u", collaborators);

  auto status = manager->getUserEngineStatus("u");
  EXPECT_FALSE(status.quoting);
  EXPECT_FALSE(status.auto_trading);

  manager->startQuoting("u", config);
  status = manager->getUserEngineStatus("u");
  EXPECT_TRUE(status.quoting);
  EXPECT_FALSE(status.auto_trading);

  manager->startAutoTrade("u", "BTCUSDT", 100ms);
  status = manager->getUserEngineStatus("u");
  EXPECT_TRUE(status.quoting);
  EXPECT_TRUE(status.auto_trading);

  const auto ids = manager->userIds();
  ASSERT_EQ(ids.size(), 1u);
  EXPECT_EQ(ids[0], "u");
}

// -----------------------------------------------------------------------------
// 4. runCycle() drives the quote engine and the orchestrator once.
// -----------------------------------------------------------------------------
// Scenario: auto-trade is disabled in settings, so the orchestrator only
// researches and skips; the quote engine places its bid/ask pair.
// -----------------------------------------------------------------------------
TEST_F(UserEngineManagerTest, RunCycleDrivesBothEngines) {
  auto manager = makeManager();
  manager->createUserEngine("u", collaborators);
  manager->startQuoting("u", config);
  manager->startAutoTrade("u", "BTCUSDT", 100ms);

  manager->runCycle("u");

  EXPECT_EQ(gateway.liveCount(autotrade::domain::Side::Buy), 1u);
  EXPECT_EQ(gateway.liveCount(autotrade::domain::Side::Sell), 1u);
  EXPECT_EQ(research.calls.load(), 1);
  EXPECT_EQ(store.executionLogs("u").size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. stopUserEngine() cancels quotes, unsubscribes, and is idempotent.
// -----------------------------------------------------------------------------
TEST_F(UserEngineManagerTest, StopUserEngineIsIdempotent) {
  auto manager = makeManager();
  manager->createUserEngine("u", collaborators);
  manager->startQuoting("u", config);
  manager->startAutoTrade("u", "BTCUSDT", 100ms);
  manager->runCycle("u");
  ASSERT_EQ(market.subscriberCount(), 1u);

  manager->stopUserEngine("u");

  auto status = manager->getUserEngineStatus("u");
  EXPECT_TRUE(status.has_engine);
  EXPECT_FALSE(status.quoting);
  EXPECT_FALSE(status.auto_trading);
  EXPECT_EQ(gateway.liveCount(autotrade::domain::Side::Buy), 0u);
  EXPECT_EQ(gateway.liveCount(autotrade::domain::Side::Sell), 0u);
  EXPECT_EQ(market.subscriberCount(), 0u);

  EXPECT_NO_FATAL_FAILURE(manager->stopUserEngine("u"));

  // A stopped engine pair can be started again.
  EXPECT_NO_THROW(manager->startQuoting("u", config));
  EXPECT_TRUE(manager->getUserEngineStatus("u").quoting);
}

// -----------------------------------------------------------------------------
// 6. Re-creating a user's engine stops the previous pair.
// -----------------------------------------------------------------------------
// Why: the old engines would otherwise keep quoting with nobody able to
// reach them.
// -----------------------------------------------------------------------------
TEST_F(UserEngineManagerTest, RecreateReplacesAndStopsPreviousEngine) {
  auto manager = makeManager();
  manager->createUserEngine("u", collaborators);
  manager->startQuoting("u", config);
  manager->runCycle("u");
  ASSERT_EQ(gateway.liveCount(autotrade::domain::Side::Buy), 1u);

  manager->createUserEngine("u", collaborators);

  EXPECT_EQ(gateway.liveCount(autotrade::domain::Side::Buy), 0u);
  EXPECT_EQ(gateway.liveCount(autotrade::domain::Side::Sell), 0u);
  EXPECT_FALSE(manager->getUserEngineStatus("u").quoting);
  EXPECT_EQ(manager->userIds().size(), 1u);
}

// -----------------------------------------------------------------------------
// 7. stopAll() stops every user.
// -----------------------------------------------------------------------------
TEST_F(UserEngineManagerTest, StopAllStopsEveryUser) {
  store.putSettings("v", autotrade::domain::TradingSettings{});
  auto manager = makeManager();
  manager->createUserEngine("u", collaborators);
  manager->createUserEngine("v", collaborators);
  manager->startAutoTrade("u", "BTCUSDT", 100ms);
  manager->startAutoTrade("v", "ETHUSDT", 100ms);

  manager->stopAll();

  EXPECT_FALSE(manager->getUserEngineStatus("u").auto_trading);
  EXPECT_FALSE(manager->getUserEngineStatus("v").auto_trading);

  auto ids = manager->userIds();
  std::sort(ids.begin(), ids.end());
  ASSERT_EQ(ids.size(), 2u);
  EXPECT_EQ(ids[0], "u");
  EXPECT_EQ(ids[1], "v");
}

// -----------------------------------------------------------------------------
// 8. Risk pause detected inside a manual cycle stops the user's engines.
// -----------------------------------------------------------------------------
// Why: the lifecycle callback arrives while the quote engine is in the
// middle of its own cycle; it must stop both engines without deadlocking.
// -----------------------------------------------------------------------------
TEST_F(UserEngineManagerTest, RiskPauseFromManualCycleStopsEngines) {
  auto manager = makeManager();
  manager->createUserEngine("u", collaborators);
  manager->startQuoting("u", config);
  manager->startAutoTrade("u", "BTCUSDT", 100ms);

  tripBreaker("u");
  manager->runCycle("u");

  const auto status = manager->getUserEngineStatus("u");
  EXPECT_FALSE(status.quoting);
  EXPECT_FALSE(status.auto_trading);
  EXPECT_TRUE(gateway.placed().empty());

  const auto settings = store.getSettings("u");
  ASSERT_TRUE(settings.has_value());
  EXPECT_EQ(settings->status, EngineStatus::PausedByRisk);
}

// -----------------------------------------------------------------------------
// 9. Risk pause detected on the quote engine's worker thread.
// -----------------------------------------------------------------------------
// How: threaded drive with a 10 ms quote loop; the breaker is tripped after
// start, the next cycle on the worker stops both engines.
// -----------------------------------------------------------------------------
TEST_F(UserEngineManagerTest, RiskPauseFromWorkerThreadStopsEngines) {
  auto manager = makeManager(autotrade::Drive::Threaded);
  manager->createUserEngine("u", collaborators);
  manager->startAutoTrade("u", "BTCUSDT", 10s);
  manager->startQuoting("u", config);

  tripBreaker("u");

  // quoting drops before the orders are cancelled and the orchestrator is
  // stopped; wait for the whole stop to land.
  auto stopped = [&] {
    const auto s = manager->getUserEngineStatus("u");
    return !s.quoting && !s.auto_trading &&
           gateway.liveCount(autotrade::domain::Side::Buy) == 0u &&
           gateway.liveCount(autotrade::domain::Side::Sell) == 0u;
  };
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!stopped() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }

  const auto status = manager->getUserEngineStatus("u");
  EXPECT_FALSE(status.quoting);
  EXPECT_FALSE(status.auto_trading);
  EXPECT_EQ(gateway.liveCount(autotrade::domain::Side::Buy), 0u);
  EXPECT_EQ(gateway.liveCount(autotrade::domain::Side::Sell), 0u);

  EXPECT_NO_FATAL_FAILURE(manager->stopAll());
}

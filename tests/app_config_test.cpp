// =============================================================================
// app_config_test.cpp
// =============================================================================
// Tests for the autotrade_engine startup configuration.
//
// Validates:
//   - An empty document yields the built-in defaults
//   - Every section is read, users included
//   - Quoting keys fall back to the user's settings
//   - Type errors and out-of-range values become ConfigurationError
//   - Environment overrides for the risk breaker
//   - loadAppConfig() on a missing or malformed file
// =============================================================================

#include "autotrade/config/app_config.hpp"
#include "autotrade/domain/errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <map>
#include <string>

using nlohmann::json;
using namespace std::chrono_literals;

namespace {

autotrade::EnvLookup envFrom(std::map<std::string, std::string> values) {
  return [values](const std::string& name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

std::string errorOf(const json& doc) {
  try {
    autotrade::parseAppConfig(doc);
  } catch (const autotrade::ConfigurationError& e) {
    return e.what();
  }
  return {};
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Defaults
// -----------------------------------------------------------------------------
TEST(AppConfigTest, EmptyDocumentKeepsDefaults) {
  const auto config = autotrade::parseAppConfig(json::object());

  EXPECT_EQ(config.risk.max_consecutive_failures, 5);
  EXPECT_EQ(config.risk.pause_cooldown_ms, 30 * 60 * 1000);
  EXPECT_DOUBLE_EQ(config.risk.default_adverse_move, 0.01);
  EXPECT_EQ(config.quote_engine.loop_interval, 100ms);
  EXPECT_EQ(config.quote_engine.error_backoff, 1000ms);
  EXPECT_EQ(config.orchestrator.exit_check_interval, 2000ms);
  EXPECT_FALSE(config.orchestrator.assumed_adverse_move.has_value());
  EXPECT_DOUBLE_EQ(config.paper_starting_balance, 10000.0);
  EXPECT_EQ(config.endpoints.market_data, "tcp://127.0.0.1:5555");
  EXPECT_EQ(config.endpoints.events, "tcp://127.0.0.1:5557");
  EXPECT_TRUE(config.users.empty());
}

// -----------------------------------------------------------------------------
// 2. A fully populated document
// -----------------------------------------------------------------------------
TEST(AppConfigTest, ParsesAllSections) {
  const json doc = json::parse(R"({
    "risk": {"max_consecutive_failures": 3, "pause_cooldown_ms": 60000,
             "default_adverse_move": 0.02, "flat_notional_per_unit": 500},
    "quote_engine": {"loop_interval_ms": 50, "error_backoff_ms": 250,
                     "quote_inside_factor": 0.25, "book_depth": 10},
    "orchestrator": {"exit_check_interval_ms": 1000, "book_depth": 5,
                     "assumed_adverse_move": 0.005},
    "paper": {"starting_balance": 2500.5},
    "endpoints": {"market_data": "tcp://10.0.0.1:6000",
                  "events": "ipc:///tmp/autotrade-events"},
    "users": [
      {"user_id": "alice",
       "settings": {"status": "paused_manual", "max_position": 0.05,
                    "per_trade_risk_pct": 1, "max_loss_pct": 5,
                    "min_accuracy_threshold": 0.7, "auto_trade_enabled": true,
                    "strategy": "orderbook_imbalance", "stop_loss_pct": 2,
                    "position_ttl_ms": 600000},
       "auto_trade": {"symbol": "BTCUSDT", "interval_ms": 3000}}
    ]
  })");

  const auto config = autotrade::parseAppConfig(doc);

  EXPECT_EQ(config.risk.max_consecutive_failures, 3);
  EXPECT_EQ(config.risk.pause_cooldown_ms, 60000);
  EXPECT_DOUBLE_EQ(config.risk.default_adverse_move, 0.02);
  EXPECT_DOUBLE_EQ(config.risk.flat_notional_per_unit, 500.0);
  EXPECT_EQ(config.quote_engine.loop_interval, 50ms);
  EXPECT_EQ(config.quote_engine.error_backoff, 250ms);
  EXPECT_DOUBLE_EQ(config.quote_engine.quote_inside_factor, 0.25);
  EXPECT_EQ(config.quote_engine.book_depth, 10u);
  EXPECT_EQ(config.orchestrator.exit_check_interval, 1000ms);
  EXPECT_EQ(config.orchestrator.book_depth, 5u);
  ASSERT_TRUE(config.orchestrator.assumed_adverse_move.has_value());
  EXPECT_DOUBLE_EQ(*config.orchestrator.assumed_adverse_move, 0.005);
  EXPECT_DOUBLE_EQ(config.paper_starting_balance, 2500.5);
  EXPECT_EQ(config.endpoints.market_data, "tcp://10.0.0.1:6000");
  EXPECT_EQ(config.endpoints.events, "ipc:///tmp/autotrade-events");

  ASSERT_EQ(config.users.size(), 1u);
  const auto& alice = config.users[0];
  EXPECT_EQ(alice.user_id, "alice");
  EXPECT_EQ(alice.settings.status,
            autotrade::domain::EngineStatus::PausedManual);
  EXPECT_DOUBLE_EQ(*alice.settings.max_position, 0.05);
  EXPECT_DOUBLE_EQ(*alice.settings.per_trade_risk_pct, 1.0);
  EXPECT_DOUBLE_EQ(*alice.settings.max_loss_pct, 5.0);
  EXPECT_FALSE(alice.settings.max_drawdown_pct.has_value());
  EXPECT_DOUBLE_EQ(alice.settings.min_accuracy_threshold, 0.7);
  EXPECT_TRUE(alice.settings.auto_trade_enabled);
  EXPECT_DOUBLE_EQ(*alice.settings.stop_loss_pct, 2.0);
  EXPECT_EQ(*alice.settings.position_ttl_ms, 600000);
  EXPECT_FALSE(alice.quoting.has_value());
  ASSERT_TRUE(alice.auto_trade.has_value());
  EXPECT_EQ(alice.auto_trade->symbol, "BTCUSDT");
  EXPECT_EQ(alice.auto_trade->interval, 3000ms);
}

// -----------------------------------------------------------------------------
// 3. Quoting falls back to settings
// -----------------------------------------------------------------------------
// Why: a user configured only through settings should quote with the same
// size, adverse threshold and cancel interval the orchestrator hands to
// strategies.
// -----------------------------------------------------------------------------
TEST(AppConfigTest, QuotingFallsBackToSettings) {
  const json doc = json::parse(R"({
    "users": [
      {"user_id": "mm",
       "settings": {"quote_size": 0.002, "adverse_pct": 0.0005,
                    "cancel_ms": 80, "max_position": 0.02},
       "quoting": {"symbol": "ETHUSDT"}},
      {"user_id": "mm2",
       "settings": {"quote_size": 0.002},
       "quoting": {"symbol": "ETHUSDT", "quote_size": 0.01,
                   "cancel_interval_ms": 200}}
    ]
  })");

  const auto config = autotrade::parseAppConfig(doc);
  ASSERT_EQ(config.users.size(), 2u);

  ASSERT_TRUE(config.users[0].quoting.has_value());
  const auto& mm = *config.users[0].quoting;
  EXPECT_EQ(mm.symbol, "ETHUSDT");
  EXPECT_DOUBLE_EQ(mm.quote_size, 0.002);
  EXPECT_DOUBLE_EQ(mm.adverse_move_pct, 0.0005);
  EXPECT_EQ(mm.cancel_interval_ms, 80);
  EXPECT_DOUBLE_EQ(mm.max_position_size, 0.02);

  const auto& mm2 = *config.users[1].quoting;
  EXPECT_DOUBLE_EQ(mm2.quote_size, 0.01);
  EXPECT_EQ(mm2.cancel_interval_ms, 200);
  EXPECT_DOUBLE_EQ(mm2.max_position_size, 0.01);
  EXPECT_FALSE(config.users[1].auto_trade.has_value());
}

// -----------------------------------------------------------------------------
// 4. Validation
// -----------------------------------------------------------------------------
TEST(AppConfigTest, RejectsInvalidValues) {
  EXPECT_EQ(errorOf(json::array()), "Config root must be an object");
  EXPECT_EQ(errorOf(json::parse(R"({"risk": 3})")),
            "Config section 'risk' must be an object");
  EXPECT_EQ(errorOf(json::parse(R"({"risk": {"max_consecutive_failures": 0}})")),
            "risk.max_consecutive_failures must be positive");
  EXPECT_EQ(
      errorOf(json::parse(R"({"quote_engine": {"quote_inside_factor": 1.5}})")),
      "quote_engine.quote_inside_factor must be within [0, 1]");
  EXPECT_EQ(errorOf(json::parse(R"({"users": {}})")),
            "'users' must be an array");
  EXPECT_EQ(errorOf(json::parse(R"({"users": [{"user_id": ""}]})")),
            "user_id must not be empty");
  EXPECT_EQ(errorOf(json::parse(
                R"({"users": [{"user_id": "a", "settings": {"status": "on"}}]})")),
            "Unknown engine status: on");
  EXPECT_EQ(
      errorOf(json::parse(
          R"({"users": [{"user_id": "a",
                         "settings": {"min_accuracy_threshold": 85}}]})")),
      "min_accuracy_threshold must be within [0, 1]");
  EXPECT_EQ(errorOf(json::parse(
                R"({"users": [{"user_id": "a",
                               "auto_trade": {"symbol": "X",
                                              "interval_ms": 0}}]})")),
            "auto_trade.interval_ms must be positive");
}

// -----------------------------------------------------------------------------
// 5. Type errors from the JSON layer
// -----------------------------------------------------------------------------
// Why: nlohmann::json::exception must not escape the config layer; callers
// only handle ConfigurationError.
// -----------------------------------------------------------------------------
TEST(AppConfigTest, TypeErrorsBecomeConfigurationError) {
  const std::string wrong_type =
      errorOf(json::parse(R"({"risk": {"pause_cooldown_ms": "soon"}})"));
  EXPECT_EQ(wrong_type.rfind("Invalid config: ", 0), 0u) << wrong_type;

  const std::string missing_id = errorOf(json::parse(R"({"users": [{}]})"));
  EXPECT_EQ(missing_id.rfind("Invalid config: ", 0), 0u) << missing_id;

  const std::string missing_symbol = errorOf(
      json::parse(R"({"users": [{"user_id": "a", "quoting": {}}]})"));
  EXPECT_EQ(missing_symbol.rfind("Invalid config: ", 0), 0u)
      << missing_symbol;
}

// -----------------------------------------------------------------------------
// 6. Environment overrides
// -----------------------------------------------------------------------------
TEST(AppConfigTest, EnvironmentOverridesRiskBreaker) {
  auto config = autotrade::parseAppConfig(json::object());

  autotrade::applyEnvironmentOverrides(config, envFrom({}));
  EXPECT_EQ(config.risk.max_consecutive_failures, 5);

  autotrade::applyEnvironmentOverrides(
      config, envFrom({{"MAX_CONSECUTIVE_FAILURES", "8"},
                       {"RISK_PAUSE_MINUTES", "15"}}));
  EXPECT_EQ(config.risk.max_consecutive_failures, 8);
  EXPECT_EQ(config.risk.pause_cooldown_ms, 15 * 60 * 1000);
}

TEST(AppConfigTest, EnvironmentRejectsNonPositiveIntegers) {
  for (const std::string bad : {"0", "-3", "abc", "5x", ""}) {
    auto config = autotrade::parseAppConfig(json::object());
    try {
      autotrade::applyEnvironmentOverrides(
          config, envFrom({{"RISK_PAUSE_MINUTES", bad}}));
      FAIL() << "accepted '" << bad << "'";
    } catch (const autotrade::ConfigurationError& e) {
      EXPECT_EQ(std::string(e.what()),
                "RISK_PAUSE_MINUTES must be a positive integer, got '" + bad +
                    "'");
    }
    EXPECT_EQ(config.risk.pause_cooldown_ms, 30 * 60 * 1000);
  }
}

// -----------------------------------------------------------------------------
// 7. loadAppConfig()
// -----------------------------------------------------------------------------
TEST(AppConfigTest, LoadReportsMissingAndMalformedFiles) {
  const std::string missing = "/nonexistent/autotrade-config.json";
  try {
    autotrade::loadAppConfig(missing);
    FAIL() << "expected ConfigurationError";
  } catch (const autotrade::ConfigurationError& e) {
    EXPECT_EQ(std::string(e.what()), "Cannot open config file: " + missing);
  }

  const std::string path = ::testing::TempDir() + "autotrade_bad_config.json";
  {
    std::ofstream out(path);
    out << "{ \"risk\": ";
  }
  EXPECT_THROW(autotrade::loadAppConfig(path), autotrade::ConfigurationError);
  std::remove(path.c_str());
}

TEST(AppConfigTest, LoadReadsFile) {
  const std::string path = ::testing::TempDir() + "autotrade_config.json";
  {
    std::ofstream out(path);
    out << R"({"paper": {"starting_balance": 42},
               "users": [{"user_id": "bob"}]})";
  }

  const auto config = autotrade::loadAppConfig(path);
  EXPECT_DOUBLE_EQ(config.paper_starting_balance, 42.0);
  ASSERT_EQ(config.users.size(), 1u);
  EXPECT_EQ(config.users[0].user_id, "bob");
  std::remove(path.c_str());
}

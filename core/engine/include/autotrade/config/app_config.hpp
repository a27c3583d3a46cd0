#pragma once

#include "autotrade/domain/risk_limits.hpp"
#include "autotrade/domain/settings.hpp"
#include "autotrade/engine/execution_orchestrator.hpp"
#include "autotrade/engine/quote_engine.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace autotrade {

struct AutoTradeConfig {
  std::string symbol;
  std::chrono::milliseconds interval{5000};
};

// One configured user: initial settings plus which loops to start.
struct UserConfig {
  std::string user_id;
  domain::TradingSettings settings;
  std::optional<EngineConfig> quoting;
  std::optional<AutoTradeConfig> auto_trade;
};

struct EndpointConfig {
  std::string market_data{"tcp://127.0.0.1:5555"};
  std::string events{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// AppConfig: everything autotrade_engine reads at startup
// -----------------------------------------------------------------------------
//
// @details
// JSON layout (every section and key optional; missing keys keep defaults,
// unknown keys are ignored):
//
//   {
//     "risk":         {"max_consecutive_failures", "pause_cooldown_ms",
//                      "default_adverse_move", "flat_notional_per_unit"},
//     "quote_engine": {"loop_interval_ms", "error_backoff_ms",
//                      "quote_inside_factor", "book_depth"},
//     "orchestrator": {"exit_check_interval_ms", "book_depth",
//                      "assumed_adverse_move"},
//     "paper":        {"starting_balance"},
//     "endpoints":    {"market_data", "events"},
//     "users": [
//       {"user_id": "...",
//        "settings":   {"status", "max_position", "per_trade_risk_pct",
//                       "max_loss_pct", "max_drawdown_pct",
//                       "min_accuracy_threshold", "auto_trade_enabled",
//                       "strategy", "quote_size", "adverse_pct", "cancel_ms",
//                       "stop_loss_pct", "take_profit_pct",
//                       "position_ttl_ms"},
//        "quoting":    {"symbol", "quote_size", "adverse_move_pct",
//                       "cancel_interval_ms", "max_position_size"},
//        "auto_trade": {"symbol", "interval_ms"}}
//     ]
//   }
//
// Quoting keys that are absent fall back to the user's settings
// (quote_size, adverse_pct, cancel_ms, max_position).
// -----------------------------------------------------------------------------
struct AppConfig {
  domain::RiskLimits risk;
  QuoteEngineOptions quote_engine;
  OrchestratorOptions orchestrator;
  double paper_starting_balance{10000.0};
  EndpointConfig endpoints;
  std::vector<UserConfig> users;
};

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup =
    std::function<std::optional<std::string>(const std::string& name)>;

// -----------------------------------------------------------------------------
// parseAppConfig(json)
// -----------------------------------------------------------------------------
// @throws ConfigurationError on a wrong type or an out-of-range value.
// -----------------------------------------------------------------------------
AppConfig parseAppConfig(const nlohmann::json& json);

// -----------------------------------------------------------------------------
// loadAppConfig(path)
// -----------------------------------------------------------------------------
// @brief  Reads and parses a JSON config file.
// @throws ConfigurationError if the file cannot be opened or parsed.
// -----------------------------------------------------------------------------
AppConfig loadAppConfig(const std::string& path);

// -----------------------------------------------------------------------------
// applyEnvironmentOverrides(config, env)
// -----------------------------------------------------------------------------
// @brief  MAX_CONSECUTIVE_FAILURES and RISK_PAUSE_MINUTES override the risk
//         section. Both must be positive integers.
//
// @throws ConfigurationError on an invalid value.
// -----------------------------------------------------------------------------
void applyEnvironmentOverrides(AppConfig& config, const EnvLookup& env);

// The process environment, via std::getenv.
std::optional<std::string> processEnv(const std::string& name);

}  // namespace autotrade

#include "autotrade/config/app_config.hpp"
#include "autotrade/domain/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace autotrade {

namespace {

template <typename T>
void read(const nlohmann::json& obj, const char* key, T& out) {
  if (obj.contains(key) && !obj.at(key).is_null()) {
    out = obj.at(key).get<T>();
  }
}

template <typename T>
void read(const nlohmann::json& obj, const char* key, std::optional<T>& out) {
  if (obj.contains(key) && !obj.at(key).is_null()) {
    out = obj.at(key).get<T>();
  }
}

void readMs(const nlohmann::json& obj, const char* key,
            std::chrono::milliseconds& out) {
  if (obj.contains(key) && !obj.at(key).is_null()) {
    out = std::chrono::milliseconds(obj.at(key).get<std::int64_t>());
  }
}

const nlohmann::json& section(const nlohmann::json& root, const char* key) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  if (!root.contains(key)) {
    return kEmpty;
  }
  const nlohmann::json& value = root.at(key);
  if (!value.is_object()) {
    throw ConfigurationError(std::string("Config section '") + key +
                             "' must be an object");
  }
  return value;
}

void require(bool ok, const std::string& message) {
  if (!ok) {
    throw ConfigurationError(message);
  }
}

domain::TradingSettings parseSettings(const nlohmann::json& obj) {
  domain::TradingSettings s;
  if (obj.contains("status")) {
    const std::string text = obj.at("status").get<std::string>();
    const auto status = domain::engineStatusFromString(text);
    require(status.has_value(), "Unknown engine status: " + text);
    s.status = *status;
  }
  read(obj, "max_position", s.max_position);
  read(obj, "per_trade_risk_pct", s.per_trade_risk_pct);
  read(obj, "max_loss_pct", s.max_loss_pct);
  read(obj, "max_drawdown_pct", s.max_drawdown_pct);
  read(obj, "min_accuracy_threshold", s.min_accuracy_threshold);
  read(obj, "auto_trade_enabled", s.auto_trade_enabled);
  read(obj, "strategy", s.strategy);
  read(obj, "quote_size", s.quote_size);
  read(obj, "adverse_pct", s.adverse_pct);
  read(obj, "cancel_ms", s.cancel_ms);
  read(obj, "stop_loss_pct", s.stop_loss_pct);
  read(obj, "take_profit_pct", s.take_profit_pct);
  read(obj, "position_ttl_ms", s.position_ttl_ms);

  require(s.min_accuracy_threshold >= 0.0 && s.min_accuracy_threshold <= 1.0,
          "min_accuracy_threshold must be within [0, 1]");
  require(s.quote_size > 0.0, "quote_size must be positive");
  require(s.cancel_ms > 0, "cancel_ms must be positive");
  return s;
}

UserConfig parseUser(const nlohmann::json& obj) {
  require(obj.is_object(), "Each users[] entry must be an object");

  UserConfig user;
  user.user_id = obj.at("user_id").get<std::string>();
  require(!user.user_id.empty(), "user_id must not be empty");

  user.settings = parseSettings(section(obj, "settings"));

  if (obj.contains("quoting")) {
    const nlohmann::json& q = section(obj, "quoting");
    EngineConfig engine;
    engine.symbol = q.at("symbol").get<std::string>();
    engine.quote_size = user.settings.quote_size;
    engine.adverse_move_pct = user.settings.adverse_pct;
    engine.cancel_interval_ms = user.settings.cancel_ms;
    if (user.settings.max_position) {
      engine.max_position_size = *user.settings.max_position;
    }
    read(q, "quote_size", engine.quote_size);
    read(q, "adverse_move_pct", engine.adverse_move_pct);
    read(q, "cancel_interval_ms", engine.cancel_interval_ms);
    read(q, "max_position_size", engine.max_position_size);
    user.quoting = engine;
  }

  if (obj.contains("auto_trade")) {
    const nlohmann::json& a = section(obj, "auto_trade");
    AutoTradeConfig auto_trade;
    auto_trade.symbol = a.at("symbol").get<std::string>();
    readMs(a, "interval_ms", auto_trade.interval);
    require(auto_trade.interval.count() > 0,
            "auto_trade.interval_ms must be positive");
    user.auto_trade = auto_trade;
  }
  return user;
}

int parsePositiveInt(const std::string& name, const std::string& text) {
  std::size_t consumed = 0;
  int value = 0;
  try {
    value = std::stoi(text, &consumed);
  } catch (const std::logic_error&) {
    throw ConfigurationError(name + " must be a positive integer, got '" +
                             text + "'");
  }
  if (consumed != text.size() || value <= 0) {
    throw ConfigurationError(name + " must be a positive integer, got '" +
                             text + "'");
  }
  return value;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseAppConfig()
// -----------------------------------------------------------------------------
AppConfig parseAppConfig(const nlohmann::json& json) {
  require(json.is_object(), "Config root must be an object");

  AppConfig config;
  try {
    const nlohmann::json& risk = section(json, "risk");
    read(risk, "max_consecutive_failures",
         config.risk.max_consecutive_failures);
    read(risk, "pause_cooldown_ms", config.risk.pause_cooldown_ms);
    read(risk, "default_adverse_move", config.risk.default_adverse_move);
    read(risk, "flat_notional_per_unit", config.risk.flat_notional_per_unit);

    const nlohmann::json& quote = section(json, "quote_engine");
    readMs(quote, "loop_interval_ms", config.quote_engine.loop_interval);
    readMs(quote, "error_backoff_ms", config.quote_engine.error_backoff);
    read(quote, "quote_inside_factor", config.quote_engine.quote_inside_factor);
    read(quote, "book_depth", config.quote_engine.book_depth);

    const nlohmann::json& orchestrator = section(json, "orchestrator");
    readMs(orchestrator, "exit_check_interval_ms",
           config.orchestrator.exit_check_interval);
    read(orchestrator, "book_depth", config.orchestrator.book_depth);
    read(orchestrator, "assumed_adverse_move",
         config.orchestrator.assumed_adverse_move);

    read(section(json, "paper"), "starting_balance",
         config.paper_starting_balance);

    const nlohmann::json& endpoints = section(json, "endpoints");
    read(endpoints, "market_data", config.endpoints.market_data);
    read(endpoints, "events", config.endpoints.events);

    if (json.contains("users")) {
      require(json.at("users").is_array(), "'users' must be an array");
      for (const auto& user : json.at("users")) {
        config.users.push_back(parseUser(user));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("Invalid config: ") + e.what());
  }

  require(config.risk.max_consecutive_failures > 0,
          "risk.max_consecutive_failures must be positive");
  require(config.risk.pause_cooldown_ms >= 0,
          "risk.pause_cooldown_ms must not be negative");
  require(config.risk.default_adverse_move > 0.0,
          "risk.default_adverse_move must be positive");
  require(config.quote_engine.loop_interval.count() > 0,
          "quote_engine.loop_interval_ms must be positive");
  require(config.quote_engine.quote_inside_factor >= 0.0 &&
              config.quote_engine.quote_inside_factor <= 1.0,
          "quote_engine.quote_inside_factor must be within [0, 1]");
  require(config.paper_starting_balance > 0.0,
          "paper.starting_balance must be positive");
  return config;
}

AppConfig loadAppConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigurationError("Cannot open config file: " + path);
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigurationError("Cannot parse config file " + path + ": " +
                             e.what());
  }

  AppConfig config = parseAppConfig(json);
  std::cout << "[AppConfig] loaded " << path << " users="
            << config.users.size() << "\n";
  return config;
}

// -----------------------------------------------------------------------------
// applyEnvironmentOverrides()
// -----------------------------------------------------------------------------
void applyEnvironmentOverrides(AppConfig& config, const EnvLookup& env) {
  if (const auto value = env("MAX_CONSECUTIVE_FAILURES")) {
    config.risk.max_consecutive_failures =
        parsePositiveInt("MAX_CONSECUTIVE_FAILURES", *value);
  }
  if (const auto value = env("RISK_PAUSE_MINUTES")) {
    config.risk.pause_cooldown_ms =
        static_cast<std::int64_t>(
            parsePositiveInt("RISK_PAUSE_MINUTES", *value)) *
        60 * 1000;
  }
}

std::optional<std::string> processEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace autotrade

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace autotrade {
namespace domain {

// -----------------------------------------------------------------------------
// EngineStatus: persisted trading status of one user
// -----------------------------------------------------------------------------
// PausedManual is set by an operator; PausedByRisk by RiskManager. Both
// block canTrade() until resumeEngine() writes Active back.
// -----------------------------------------------------------------------------
enum class EngineStatus {
  Active,
  PausedManual,
  PausedByRisk,
};

inline bool isPaused(EngineStatus s) { return s != EngineStatus::Active; }

// "active", "paused_manual", "paused_by_risk": the persisted spelling.
const char* toString(EngineStatus s);

std::optional<EngineStatus> engineStatusFromString(const std::string& s);

// -----------------------------------------------------------------------------
// TradingSettings
// -----------------------------------------------------------------------------
//
// @brief  Per-user trading configuration as stored in the record store.
//
// @details
// Risk limits are percentages (1 means 1%). An unset or zero limit disables
// the corresponding check, which is how the store represents "no limit".
// The remaining fields parameterize the execution orchestrator and the
// strategy it initializes.
// -----------------------------------------------------------------------------
struct TradingSettings {
  EngineStatus status{EngineStatus::Active};

  std::optional<double> max_position;
  std::optional<double> per_trade_risk_pct;
  std::optional<double> max_loss_pct;
  std::optional<double> max_drawdown_pct;

  double min_accuracy_threshold{0.85};
  bool auto_trade_enabled{false};
  std::string strategy{"orderbook_imbalance"};
  double quote_size{0.001};

  // Strategy parameters handed to IStrategyRunner::initializeStrategy().
  double adverse_pct{0.0002};
  std::int64_t cancel_ms{40};
  std::optional<double> stop_loss_pct;
  std::optional<double> take_profit_pct;
  std::optional<std::int64_t> position_ttl_ms;
};

// -----------------------------------------------------------------------------
// SettingsPatch: partial update for IRecordStore::saveSettings()
// -----------------------------------------------------------------------------
// Only the engaged fields are written; everything else is left as stored.
// -----------------------------------------------------------------------------
struct SettingsPatch {
  std::optional<EngineStatus> status;
  std::optional<bool> auto_trade_enabled;
  std::optional<double> min_accuracy_threshold;
  std::optional<std::string> strategy;
};

}  // namespace domain
}  // namespace autotrade

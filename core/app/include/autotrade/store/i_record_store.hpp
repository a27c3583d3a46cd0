#pragma once

#include "autotrade/domain/records.hpp"
#include "autotrade/domain/settings.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace autotrade {

// -----------------------------------------------------------------------------
// IRecordStore: settings, trade records, execution logs and counters
// -----------------------------------------------------------------------------
//
// @brief  Persistence boundary of the engines.
//
// @details
// getSettings() returns std::nullopt for a user with no stored settings;
// what that means is the caller's decision (RiskManager treats it as a
// configuration error, ExecutionOrchestrator falls back to defaults).
// I/O failures are thrown. Activity payloads are free-form JSON because the
// activity feed is consumed by external tooling only.
//
// Thread model: Implementations must accept concurrent calls from every
// user's engine threads.
// -----------------------------------------------------------------------------
class IRecordStore {
 public:
  virtual ~IRecordStore() = default;

  virtual std::optional<domain::TradingSettings> getSettings(
      const std::string& user_id) = 0;

  virtual void saveSettings(const std::string& user_id,
                            const domain::SettingsPatch& patch) = 0;

  // @return the id assigned to the stored trade.
  virtual std::string saveTrade(const std::string& user_id,
                                const domain::TradeRecord& trade) = 0;

  virtual void saveExecutionLog(const std::string& user_id,
                                const domain::ExecutionLogRecord& record) = 0;

  virtual void logActivity(const std::string& user_id,
                           const std::string& type,
                           const nlohmann::json& payload) = 0;

  virtual std::optional<domain::UserStats> getUser(
      const std::string& user_id) = 0;

  virtual void createOrUpdateUser(const domain::UserStats& stats) = 0;

  virtual domain::GlobalStats getGlobalStats() = 0;

  virtual void updateGlobalStats(const domain::GlobalStats& stats) = 0;
};

}  // namespace autotrade

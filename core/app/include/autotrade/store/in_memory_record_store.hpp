#pragma once

#include "autotrade/store/i_record_store.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace autotrade {

// -----------------------------------------------------------------------------
// InMemoryRecordStore: process-local IRecordStore
// -----------------------------------------------------------------------------
//
// @brief  Keeps settings, trades, execution logs, activities and counters in
//         memory for the lifetime of the process.
//
// @details
// Backs the paper-trading binary and every engine test. Settings are seeded
// with putSettings() (from the config file or a test); saveSettings() then
// applies partial patches on top. Patches for a user without settings are
// dropped with a warning, mirroring a store that has no row to update.
//
// The read accessors (executionLogs(), trades(), activities()) return copies
// and exist so tests and the admin channel can inspect the decision trail.
//
// Thread model: One mutex for everything. The store is touched a handful of
// times per cycle and never on the quoting hot path.
// -----------------------------------------------------------------------------
class InMemoryRecordStore final : public IRecordStore {
 public:
  struct ActivityEntry {
    std::string type;
    nlohmann::json payload;
  };

  InMemoryRecordStore() = default;

  InMemoryRecordStore(const InMemoryRecordStore&) = delete;
  InMemoryRecordStore& operator=(const InMemoryRecordStore&) = delete;

  // Replaces the stored settings wholesale.
  void putSettings(const std::string& user_id,
                   const domain::TradingSettings& settings);

  // --- IRecordStore ---------------------------------------------------------
  std::optional<domain::TradingSettings> getSettings(
      const std::string& user_id) override;
  void saveSettings(const std::string& user_id,
                    const domain::SettingsPatch& patch) override;
  std::string saveTrade(const std::string& user_id,
                        const domain::TradeRecord& trade) override;
  void saveExecutionLog(const std::string& user_id,
                        const domain::ExecutionLogRecord& record) override;
  void logActivity(const std::string& user_id, const std::string& type,
                   const nlohmann::json& payload) override;
  std::optional<domain::UserStats> getUser(const std::string& user_id) override;
  void createOrUpdateUser(const domain::UserStats& stats) override;
  domain::GlobalStats getGlobalStats() override;
  void updateGlobalStats(const domain::GlobalStats& stats) override;

  // --- Inspection -----------------------------------------------------------
  std::vector<domain::ExecutionLogRecord> executionLogs(
      const std::string& user_id) const;
  std::vector<domain::TradeRecord> trades(const std::string& user_id) const;
  std::vector<ActivityEntry> activities(const std::string& user_id) const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, domain::TradingSettings> settings_;
  std::unordered_map<std::string, std::vector<domain::TradeRecord>> trades_;
  std::unordered_map<std::string, std::vector<domain::ExecutionLogRecord>>
      execution_logs_;
  std::unordered_map<std::string, std::vector<ActivityEntry>> activities_;
  std::unordered_map<std::string, domain::UserStats> users_;
  domain::GlobalStats global_stats_;
  std::uint64_t next_trade_id_{1};
};

}  // namespace autotrade

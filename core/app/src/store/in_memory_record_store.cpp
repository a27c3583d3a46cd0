#include "autotrade/store/in_memory_record_store.hpp"

#include <iostream>

namespace autotrade {

void InMemoryRecordStore::putSettings(const std::string& user_id,
                                      const domain::TradingSettings& settings) {
  std::lock_guard lock(mutex_);
  settings_[user_id] = settings;
}

std::optional<domain::TradingSettings> InMemoryRecordStore::getSettings(
    const std::string& user_id) {
  std::lock_guard lock(mutex_);
  auto it = settings_.find(user_id);
  if (it == settings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryRecordStore::saveSettings(const std::string& user_id,
                                       const domain::SettingsPatch& patch) {
  std::lock_guard lock(mutex_);
  auto it = settings_.find(user_id);
  if (it == settings_.end()) {
    std::cerr << "[InMemoryRecordStore] no settings for user=" << user_id
              << ", patch dropped.\n";
    return;
  }

  domain::TradingSettings& s = it->second;
  if (patch.status) s.status = *patch.status;
  if (patch.auto_trade_enabled) s.auto_trade_enabled = *patch.auto_trade_enabled;
  if (patch.min_accuracy_threshold) {
    s.min_accuracy_threshold = *patch.min_accuracy_threshold;
  }
  if (patch.strategy) s.strategy = *patch.strategy;
}

std::string InMemoryRecordStore::saveTrade(const std::string& user_id,
                                           const domain::TradeRecord& trade) {
  std::lock_guard lock(mutex_);
  domain::TradeRecord stored = trade;
  stored.id = "trade-" + std::to_string(next_trade_id_++);
  stored.user_id = user_id;
  trades_[user_id].push_back(stored);
  return stored.id;
}

void InMemoryRecordStore::saveExecutionLog(
    const std::string& user_id, const domain::ExecutionLogRecord& record) {
  std::lock_guard lock(mutex_);
  execution_logs_[user_id].push_back(record);
}

void InMemoryRecordStore::logActivity(const std::string& user_id,
                                      const std::string& type,
                                      const nlohmann::json& payload) {
  std::lock_guard lock(mutex_);
  activities_[user_id].push_back(ActivityEntry{type, payload});
}

std::optional<domain::UserStats> InMemoryRecordStore::getUser(
    const std::string& user_id) {
  std::lock_guard lock(mutex_);
  auto it = users_.find(user_id);
  if (it == users_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryRecordStore::createOrUpdateUser(const domain::UserStats& stats) {
  std::lock_guard lock(mutex_);
  users_[stats.user_id] = stats;
}

domain::GlobalStats InMemoryRecordStore::getGlobalStats() {
  std::lock_guard lock(mutex_);
  return global_stats_;
}

void InMemoryRecordStore::updateGlobalStats(const domain::GlobalStats& stats) {
  std::lock_guard lock(mutex_);
  global_stats_ = stats;
}

std::vector<domain::ExecutionLogRecord> InMemoryRecordStore::executionLogs(
    const std::string& user_id) const {
  std::lock_guard lock(mutex_);
  auto it = execution_logs_.find(user_id);
  return it == execution_logs_.end()
             ? std::vector<domain::ExecutionLogRecord>{}
             : it->second;
}

std::vector<domain::TradeRecord> InMemoryRecordStore::trades(
    const std::string& user_id) const {
  std::lock_guard lock(mutex_);
  auto it = trades_.find(user_id);
  return it == trades_.end() ? std::vector<domain::TradeRecord>{} : it->second;
}

std::vector<InMemoryRecordStore::ActivityEntry>
InMemoryRecordStore::activities(const std::string& user_id) const {
  std::lock_guard lock(mutex_);
  auto it = activities_.find(user_id);
  return it == activities_.end() ? std::vector<ActivityEntry>{} : it->second;
}

}  // namespace autotrade

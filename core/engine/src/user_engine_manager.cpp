#include "autotrade/engine/user_engine_manager.hpp"
#include "autotrade/domain/errors.hpp"

#include <iostream>
#include <utility>

namespace autotrade {

UserEngineManager::UserEngineManager(RiskManager& risk, IRecordStore& store,
                                     const ITimeProvider& clock,
                                     QuoteEngineOptions quote_options,
                                     OrchestratorOptions orchestrator_options,
                                     Drive drive)
    : risk_(risk),
      store_(store),
      clock_(clock),
      quote_options_(std::move(quote_options)),
      orchestrator_options_(std::move(orchestrator_options)),
      drive_(drive) {}

UserEngineManager::~UserEngineManager() { stopAll(); }

// -----------------------------------------------------------------------------
// createUserEngine()
// -----------------------------------------------------------------------------
void UserEngineManager::createUserEngine(const std::string& user_id,
                                         const UserCollaborators& c) {
  if (user_id.empty()) {
    throw ConfigurationError("createUserEngine requires a user id");
  }
  if (c.market == nullptr || c.orders == nullptr || c.accounts == nullptr ||
      c.research == nullptr || c.strategies == nullptr) {
    throw ConfigurationError("Missing required collaborator for user " +
                             user_id);
  }

  auto entry = std::make_shared<Entry>();
  entry->collaborators = c;

  entry->quote = std::make_unique<QuoteEngine>(
      user_id, risk_, *c.orders, *c.accounts, clock_, quote_options_, drive_);
  entry->quote->setMetricsSink(c.metrics);
  entry->quote->setBroadcastSink(c.broadcast);

  entry->orchestrator = std::make_unique<ExecutionOrchestrator>(
      user_id, risk_, *c.research, *c.market, *c.orders, *c.strategies,
      store_, clock_, orchestrator_options_, drive_);
  entry->orchestrator->setPositionManager(c.positions);
  entry->orchestrator->setMetricsSink(c.metrics);
  entry->orchestrator->setBroadcastSink(c.broadcast);
  entry->orchestrator->setAdminSink(c.admin);

  std::shared_ptr<Entry> previous;
  {
    std::lock_guard lock(mutex_);
    previous = std::exchange(entries_[user_id], std::move(entry));
  }

  if (previous) {
    stopEntry(user_id, *previous);
  }

  std::cout << "[UserEngineManager] engine created user=" << user_id << "\n";
}

void UserEngineManager::startQuoting(const std::string& user_id,
                                     const EngineConfig& config) {
  std::shared_ptr<Entry> entry = require(user_id);
  entry->quote->start(config, *entry->collaborators.market,
                      entry->collaborators.feed);
}

void UserEngineManager::startAutoTrade(const std::string& user_id,
                                       const std::string& symbol,
                                       std::chrono::milliseconds interval) {
  std::shared_ptr<Entry> entry = require(user_id);
  entry->orchestrator->start(symbol, interval);
}

// -----------------------------------------------------------------------------
// stopUserEngine(): one caller does the work, the rest return
// -----------------------------------------------------------------------------
void UserEngineManager::stopUserEngine(const std::string& user_id) {
  std::shared_ptr<Entry> entry = find(user_id);
  if (!entry) {
    return;
  }
  stopEntry(user_id, *entry);
}

void UserEngineManager::stopEntry(const std::string& user_id, Entry& entry) {
  if (entry.stopping.exchange(true)) {
    return;
  }

  entry.quote->stop();
  entry.orchestrator->stop();

  entry.stopping.store(false);
  std::cout << "[UserEngineManager] engines stopped user=" << user_id << "\n";
}

void UserEngineManager::stopAll() {
  std::vector<std::pair<std::string, std::shared_ptr<Entry>>> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot.assign(entries_.begin(), entries_.end());
  }
  for (auto& [user_id, entry] : snapshot) {
    stopEntry(user_id, *entry);
  }
}

UserEngineStatus UserEngineManager::getUserEngineStatus(
    const std::string& user_id) const {
  UserEngineStatus status;
  std::shared_ptr<Entry> entry = find(user_id);
  if (!entry) {
    return status;
  }
  status.has_engine = true;
  status.quoting = entry->quote->running();
  status.auto_trading = entry->orchestrator->running();
  return status;
}

std::vector<std::string> UserEngineManager::userIds() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto& [user_id, entry] : entries_) {
    ids.push_back(user_id);
  }
  return ids;
}

void UserEngineManager::runCycle(const std::string& user_id) {
  std::shared_ptr<Entry> entry = require(user_id);
  entry->quote->runCycle();
  entry->orchestrator->runCycle();
}

std::shared_ptr<UserEngineManager::Entry> UserEngineManager::find(
    const std::string& user_id) const {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(user_id);
  return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<UserEngineManager::Entry> UserEngineManager::require(
    const std::string& user_id) const {
  std::shared_ptr<Entry> entry = find(user_id);
  if (!entry) {
    throw ConfigurationError("No engine for user " + user_id);
  }
  return entry;
}

}  // namespace autotrade

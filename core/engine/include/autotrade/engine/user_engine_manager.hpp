#pragma once

#include "autotrade/engine/drive.hpp"
#include "autotrade/engine/execution_orchestrator.hpp"
#include "autotrade/engine/quote_engine.hpp"
#include "autotrade/risk/i_engine_lifecycle.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace autotrade {

// -----------------------------------------------------------------------------
// UserCollaborators: per-user wiring for one engine pair
// -----------------------------------------------------------------------------
// Required: market, orders, accounts, research, strategies.
// Optional (nullptr skips the feature): feed, positions, metrics, broadcast,
// admin. All pointers are non-owning and must outlive the engines.
// -----------------------------------------------------------------------------
struct UserCollaborators {
  IMarketDataSource* market{nullptr};
  IOrderbookFeed* feed{nullptr};
  IOrderGateway* orders{nullptr};
  IPositionManager* positions{nullptr};
  IAccountProvider* accounts{nullptr};
  IResearchProvider* research{nullptr};
  IStrategyRunner* strategies{nullptr};
  IMetricsSink* metrics{nullptr};
  IBroadcastSink* broadcast{nullptr};
  IBroadcastSink* admin{nullptr};
};

struct UserEngineStatus {
  bool has_engine{false};
  bool quoting{false};
  bool auto_trading{false};
};

// -----------------------------------------------------------------------------
// UserEngineManager
// -----------------------------------------------------------------------------
//
// @brief  Owns each user's QuoteEngine and ExecutionOrchestrator and stops
//         them on request, including from RiskManager on a risk pause.
//
// @details
// Entries are held by shared_ptr: an operation copies the pointer under
// mutex_ and works on the entry without the registry lock, so a slow stop
// for one user never blocks lookups for another.
//
// stopUserEngine() is re-entrant. A risk pause detected on an engine's own
// worker calls back into stopUserEngine() for the same user while another
// thread may already be stopping it; a per-entry flag lets exactly one
// caller do the work and the others return immediately.
//
// Ownership:
//   Owns the engines. Holds references to RiskManager, the record store and
//   the clock, which must outlive the manager.
// -----------------------------------------------------------------------------
class UserEngineManager final : public IEngineLifecycle {
 public:
  UserEngineManager(RiskManager& risk, IRecordStore& store,
                    const ITimeProvider& clock,
                    QuoteEngineOptions quote_options = {},
                    OrchestratorOptions orchestrator_options = {},
                    Drive drive = Drive::Threaded);

  // Stops every engine.
  ~UserEngineManager() override;

  UserEngineManager(const UserEngineManager&) = delete;
  UserEngineManager& operator=(const UserEngineManager&) = delete;
  UserEngineManager(UserEngineManager&&) = delete;
  UserEngineManager& operator=(UserEngineManager&&) = delete;

  // -------------------------------------------------------------------------
  // createUserEngine(user_id, collaborators)
  // -------------------------------------------------------------------------
  // @brief  Builds a stopped engine pair for the user, replacing (and
  //         stopping) any previous pair.
  //
  // @throws ConfigurationError for an empty user id or a missing required
  //         collaborator.
  // -------------------------------------------------------------------------
  void createUserEngine(const std::string& user_id,
                        const UserCollaborators& collaborators);

  // @throws ConfigurationError if the user has no engine; otherwise whatever
  //         QuoteEngine::start() throws.
  void startQuoting(const std::string& user_id, const EngineConfig& config);

  // @throws ConfigurationError if the user has no engine; otherwise whatever
  //         ExecutionOrchestrator::start() throws.
  void startAutoTrade(const std::string& user_id, const std::string& symbol,
                      std::chrono::milliseconds interval);

  // Stops both loops. No-op for unknown users.
  void stopUserEngine(const std::string& user_id) override;

  void stopAll();

  UserEngineStatus getUserEngineStatus(const std::string& user_id) const;

  std::vector<std::string> userIds() const;

  // Drive::Manual: one quote cycle then one orchestrator cycle for the user.
  void runCycle(const std::string& user_id);

 private:
  struct Entry {
    UserCollaborators collaborators;
    std::unique_ptr<QuoteEngine> quote;
    std::unique_ptr<ExecutionOrchestrator> orchestrator;
    std::atomic<bool> stopping{false};
  };

  std::shared_ptr<Entry> find(const std::string& user_id) const;
  std::shared_ptr<Entry> require(const std::string& user_id) const;

  static void stopEntry(const std::string& user_id, Entry& entry);

  RiskManager& risk_;
  IRecordStore& store_;
  const ITimeProvider& clock_;
  const QuoteEngineOptions quote_options_;
  const OrchestratorOptions orchestrator_options_;
  const Drive drive_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace autotrade

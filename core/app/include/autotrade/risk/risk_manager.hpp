#pragma once

#include "autotrade/domain/risk_limits.hpp"
#include "autotrade/domain/settings.hpp"
#include "autotrade/risk/i_account_provider.hpp"
#include "autotrade/risk/i_engine_lifecycle.hpp"
#include "autotrade/store/i_record_store.hpp"
#include "autotrade/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace autotrade {

// -----------------------------------------------------------------------------
// RiskDecision: result of a pre-trade check
// -----------------------------------------------------------------------------
// Denials are values, never exceptions. reason is set exactly when
// allowed == false.
// -----------------------------------------------------------------------------
struct RiskDecision {
  bool allowed{true};
  std::optional<std::string> reason;

  static RiskDecision allow() { return RiskDecision{}; }
  static RiskDecision deny(std::string why) {
    return RiskDecision{false, std::move(why)};
  }
};

// -----------------------------------------------------------------------------
// RiskState: in-memory risk bookkeeping for one user
// -----------------------------------------------------------------------------
//
// @details
// daily_start_day is the local_day_key() of the current daily window (0
// until the first recorded trade). Invariant: paused implies pause_reason.
// -----------------------------------------------------------------------------
struct RiskState {
  double daily_loss{0.0};
  double daily_start_balance{0.0};
  std::int32_t daily_start_day{0};
  double peak_balance{0.0};
  int consecutive_failures{0};
  std::int64_t last_failure_ms{0};
  bool paused{false};
  std::optional<std::string> pause_reason;
};

// -----------------------------------------------------------------------------
// RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Per-user pre-trade gate and post-trade bookkeeping. Every order the
//         engines place goes through canTrade() first.
//
// @details
// canTrade() evaluates, first failing check wins:
//
//   1. Persisted status paused_manual / paused_by_risk  → deny.
//   2. In-memory pause still inside the cooldown        → deny with its reason;
//      cooldown elapsed                                 → clear and continue.
//   3. consecutive_failures ≥ limit inside the cooldown → pause, deny;
//      cooldown elapsed                                 → reset counter.
//   4. |position + size| > max_position                 → deny.
//   5. size × mid × adverse > balance × per_trade_pct   → deny. Without a mid
//      the estimate is size × flat_notional_per_unit.
//   6. daily_loss < -(balance × max_loss_pct)           → pause, deny.
//   7. peak - balance > peak × max_drawdown_pct         → pause, deny.
//
// "Pause" means: set paused/pause_reason in memory, persist paused_by_risk
// and ask the IEngineLifecycle to stop the user's engines.
//
// Cooldowns are measured from last_failure_ms, the time of the most recent
// failed trade.
//
// Thread model:
//   Per-user state lives in its own Entry with its own mutex. The registry
//   map is guarded by registry_mutex_ (shared for lookup, exclusive only to
//   insert a new user), so unrelated users never contend on a common lock.
//   Collaborator I/O (settings, balance, position) happens before the entry
//   lock is taken, and pause side effects after it is released: stopping an
//   engine joins threads that may themselves be waiting to call canTrade().
//
// Ownership:
//   Holds references to the record store, account provider and clock; all
//   must outlive it. The lifecycle pointer is non-owning and may be null.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  RiskManager(IRecordStore& store, IAccountProvider& accounts,
              const ITimeProvider& clock, domain::RiskLimits limits = {});

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;
  RiskManager(RiskManager&&) = delete;
  RiskManager& operator=(RiskManager&&) = delete;

  // -------------------------------------------------------------------------
  // setEngineLifecycle(lifecycle)
  // -------------------------------------------------------------------------
  // @brief  Wires the component that stops a user's engines on a pause.
  //
  // @details
  // Set after construction because UserEngineManager itself needs a
  // RiskManager to build engines. Null disables the stop side effect.
  // -------------------------------------------------------------------------
  void setEngineLifecycle(IEngineLifecycle* lifecycle);

  // -------------------------------------------------------------------------
  // canTrade(...)
  // -------------------------------------------------------------------------
  // @brief  Pre-trade risk gate.
  //
  // @param  mid_price             Current mid; nullopt or ≤ 0 selects the flat
  //                               notional estimate.
  // @param  assumed_adverse_move  Fractional adverse move; nullopt or ≤ 0
  //                               selects RiskLimits::default_adverse_move.
  //
  // @throws ConfigurationError if the user has no stored settings.
  //         Anything the settings/account collaborators throw propagates;
  //         callers must treat that as a denial.
  //
  // Side-effects: None on allow. Pause transitions as described above.
  // -------------------------------------------------------------------------
  RiskDecision canTrade(const std::string& user_id, const std::string& symbol,
                        double trade_size,
                        std::optional<double> mid_price = std::nullopt,
                        std::optional<double> assumed_adverse_move =
                            std::nullopt);

  // -------------------------------------------------------------------------
  // recordTradeResult(user_id, pnl, success)
  // -------------------------------------------------------------------------
  // @brief  Post-trade bookkeeping.
  //
  // @details
  // Rolls the daily window first when the local calendar day changed
  // (daily_loss = 0, daily_start_balance = balance), then adds pnl, raises
  // the peak balance, and resets or increments the failure counter. Failures
  // stamp last_failure_ms.
  // -------------------------------------------------------------------------
  void recordTradeResult(const std::string& user_id, double pnl, bool success);

  // -------------------------------------------------------------------------
  // pauseEngine(user_id, status)
  // -------------------------------------------------------------------------
  // @brief  Persists a pause status and stops the user's engines.
  //
  // @details
  // Does not touch the in-memory state; the persisted status alone blocks
  // canTrade() until resumeEngine(). Passing Active is equivalent to
  // resumeEngine().
  // -------------------------------------------------------------------------
  void pauseEngine(const std::string& user_id, domain::EngineStatus status);

  // Clears paused/pause_reason/consecutive_failures and persists Active.
  void resumeEngine(const std::string& user_id);

  // Snapshot of the user's state, or nullopt if the user was never seen.
  std::optional<RiskState> getState(const std::string& user_id) const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  struct Entry {
    std::mutex mutex;
    RiskState state;
  };

  // Lookup-or-insert. The returned reference stays valid for the lifetime
  // of the manager: entries are never erased.
  Entry& entryFor(const std::string& user_id);

  void applyRiskPause(const std::string& user_id, const std::string& reason);

  IRecordStore& store_;
  IAccountProvider& accounts_;
  const ITimeProvider& clock_;
  const domain::RiskLimits limits_;

  std::atomic<IEngineLifecycle*> lifecycle_{nullptr};

  mutable std::shared_mutex registry_mutex_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

}  // namespace autotrade

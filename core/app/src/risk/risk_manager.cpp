#include "autotrade/risk/risk_manager.hpp"
#include "autotrade/domain/errors.hpp"
#include "autotrade/time/time_utils.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <sstream>

namespace autotrade {

namespace {

// Settings store percentages; zero or unset means "no limit".
bool limitEnabled(const std::optional<double>& pct) {
  return pct.has_value() && *pct > 0.0;
}

}  // namespace

RiskManager::RiskManager(IRecordStore& store, IAccountProvider& accounts,
                         const ITimeProvider& clock, domain::RiskLimits limits)
    : store_(store), accounts_(accounts), clock_(clock), limits_(limits) {}

void RiskManager::setEngineLifecycle(IEngineLifecycle* lifecycle) {
  lifecycle_.store(lifecycle);
}

// -----------------------------------------------------------------------------
// entryFor: shared lock for the common case, exclusive only to insert
// -----------------------------------------------------------------------------
RiskManager::Entry& RiskManager::entryFor(const std::string& user_id) {
  {
    std::shared_lock lock(registry_mutex_);
    auto it = entries_.find(user_id);
    if (it != entries_.end()) {
      return *it->second;
    }
  }

  std::unique_lock lock(registry_mutex_);
  auto& slot = entries_[user_id];
  if (!slot) {
    slot = std::make_unique<Entry>();
  }
  return *slot;
}

// -----------------------------------------------------------------------------
// canTrade
// -----------------------------------------------------------------------------
RiskDecision RiskManager::canTrade(const std::string& user_id,
                                   const std::string& symbol,
                                   double trade_size,
                                   std::optional<double> mid_price,
                                   std::optional<double> assumed_adverse_move) {
  const std::optional<domain::TradingSettings> settings =
      store_.getSettings(user_id);
  if (!settings) {
    throw ConfigurationError("Settings not found for user " + user_id);
  }

  // --- 1) Persisted pause ---------------------------------------------------
  if (domain::isPaused(settings->status)) {
    return RiskDecision::deny(std::string("Engine paused: ") +
                              domain::toString(settings->status));
  }

  // --- Collaborator I/O, before the per-user lock ---------------------------
  const bool check_position =
      settings->max_position.has_value() && *settings->max_position > 0.0;
  const bool need_balance = limitEnabled(settings->per_trade_risk_pct) ||
                            limitEnabled(settings->max_loss_pct) ||
                            limitEnabled(settings->max_drawdown_pct);

  const double position =
      check_position ? accounts_.position(user_id, symbol) : 0.0;
  const double balance = need_balance ? accounts_.balance(user_id) : 0.0;
  const std::int64_t now = clock_.now_ms();

  Entry& entry = entryFor(user_id);

  RiskDecision decision = RiskDecision::allow();
  bool pause_requested = false;
  {
    std::lock_guard lock(entry.mutex);
    RiskState& state = entry.state;
    const bool within_cooldown =
        now - state.last_failure_ms < limits_.pause_cooldown_ms;

    // Marks the user paused and denies. Side effects run after unlock.
    auto pause = [&](const std::string& reason) {
      state.paused = true;
      state.pause_reason = reason;
      pause_requested = true;
      decision = RiskDecision::deny(reason);
    };

    // --- 2) In-memory pause with auto-resume --------------------------------
    if (state.paused) {
      if (within_cooldown) {
        return RiskDecision::deny(
            state.pause_reason.value_or("Paused due to risk limits"));
      }
      state.paused = false;
      state.pause_reason.reset();
    }

    // --- 3) Consecutive failure breaker -------------------------------------
    if (state.consecutive_failures >= limits_.max_consecutive_failures) {
      if (within_cooldown) {
        std::ostringstream reason;
        reason << "Too many consecutive failures: "
               << state.consecutive_failures;
        pause(reason.str());
      } else {
        state.consecutive_failures = 0;
      }
    }

    // --- 4) Max position ----------------------------------------------------
    if (!pause_requested && check_position &&
        std::abs(position + trade_size) > *settings->max_position) {
      std::ostringstream reason;
      reason << "Max position exceeded: " << (position + trade_size) << " > "
             << *settings->max_position;
      return RiskDecision::deny(reason.str());
    }

    // --- 5) Per-trade risk --------------------------------------------------
    if (!pause_requested && limitEnabled(settings->per_trade_risk_pct)) {
      const double max_trade_risk =
          balance * (*settings->per_trade_risk_pct / 100.0);
      const double adverse =
          (assumed_adverse_move && *assumed_adverse_move > 0.0)
              ? *assumed_adverse_move
              : limits_.default_adverse_move;
      const double estimated_risk =
          (mid_price && *mid_price > 0.0)
              ? trade_size * *mid_price * adverse
              : trade_size * limits_.flat_notional_per_unit;
      if (estimated_risk > max_trade_risk) {
        return RiskDecision::deny("Per-trade risk exceeded");
      }
    }

    // --- 6) Daily loss ------------------------------------------------------
    if (!pause_requested && limitEnabled(settings->max_loss_pct)) {
      const double max_daily_loss =
          balance * (*settings->max_loss_pct / 100.0);
      if (state.daily_loss < -max_daily_loss) {
        std::ostringstream reason;
        reason << "Daily loss limit exceeded: " << state.daily_loss << " < -"
               << max_daily_loss;
        pause(reason.str());
      }
    }

    // --- 7) Drawdown --------------------------------------------------------
    if (!pause_requested && limitEnabled(settings->max_drawdown_pct)) {
      const double drawdown = state.peak_balance - balance;
      const double max_drawdown =
          state.peak_balance * (*settings->max_drawdown_pct / 100.0);
      if (drawdown > max_drawdown) {
        std::ostringstream reason;
        reason << "Max drawdown exceeded: " << drawdown << " > "
               << max_drawdown;
        pause(reason.str());
      }
    }
  }

  if (pause_requested) {
    applyRiskPause(user_id, *decision.reason);
  }
  return decision;
}

// -----------------------------------------------------------------------------
// applyRiskPause: persist + stop, called without any entry lock held
// -----------------------------------------------------------------------------
void RiskManager::applyRiskPause(const std::string& user_id,
                                 const std::string& reason) {
  std::cerr << "[RiskManager] RISK PAUSE user=" << user_id
            << " reason=\"" << reason << "\"\n";

  // The in-memory pause already blocks trading. A failure to persist or to
  // stop the engines must not turn the denial into an exception.
  try {
    pauseEngine(user_id, domain::EngineStatus::PausedByRisk);
  } catch (const std::exception& e) {
    std::cerr << "[RiskManager] failed to apply risk pause for user="
              << user_id << ": " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// recordTradeResult
// -----------------------------------------------------------------------------
void RiskManager::recordTradeResult(const std::string& user_id, double pnl,
                                    bool success) {
  const double balance = accounts_.balance(user_id);
  const std::int64_t now = clock_.now_ms();
  const std::int32_t today = local_day_key(now);

  Entry& entry = entryFor(user_id);

  int failures = 0;
  double daily_loss = 0.0;
  {
    std::lock_guard lock(entry.mutex);
    RiskState& state = entry.state;

    // Roll the window before applying pnl so yesterday's loss never leaks
    // into today's limit.
    if (state.daily_start_day != today) {
      state.daily_loss = 0.0;
      state.daily_start_balance = balance;
      state.daily_start_day = today;
    }

    state.daily_loss += pnl;

    if (balance > state.peak_balance) {
      state.peak_balance = balance;
    }

    if (success) {
      state.consecutive_failures = 0;
    } else {
      ++state.consecutive_failures;
      state.last_failure_ms = now;
    }

    failures = state.consecutive_failures;
    daily_loss = state.daily_loss;
  }

  std::cout << "[RiskManager] trade result user=" << user_id
            << " pnl=" << pnl << " success=" << (success ? "true" : "false")
            << " consecutive_failures=" << failures
            << " daily_loss=" << daily_loss << "\n";
}

// -----------------------------------------------------------------------------
// pauseEngine / resumeEngine
// -----------------------------------------------------------------------------
void RiskManager::pauseEngine(const std::string& user_id,
                              domain::EngineStatus status) {
  if (!domain::isPaused(status)) {
    resumeEngine(user_id);
    return;
  }

  domain::SettingsPatch patch;
  patch.status = status;
  store_.saveSettings(user_id, patch);

  if (IEngineLifecycle* lifecycle = lifecycle_.load()) {
    lifecycle->stopUserEngine(user_id);
  }

  std::cerr << "[RiskManager] engine paused user=" << user_id
            << " status=" << domain::toString(status) << "\n";
}

void RiskManager::resumeEngine(const std::string& user_id) {
  Entry& entry = entryFor(user_id);
  {
    std::lock_guard lock(entry.mutex);
    entry.state.paused = false;
    entry.state.pause_reason.reset();
    entry.state.consecutive_failures = 0;
  }

  domain::SettingsPatch patch;
  patch.status = domain::EngineStatus::Active;
  store_.saveSettings(user_id, patch);

  std::cout << "[RiskManager] engine resumed user=" << user_id << "\n";
}

std::optional<RiskState> RiskManager::getState(
    const std::string& user_id) const {
  Entry* entry = nullptr;
  {
    std::shared_lock lock(registry_mutex_);
    auto it = entries_.find(user_id);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    entry = it->second.get();
  }

  std::lock_guard lock(entry->mutex);
  return entry->state;
}

}  // namespace autotrade

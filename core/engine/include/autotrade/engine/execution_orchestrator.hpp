#pragma once

#include "autotrade/concurrent/periodic_task.hpp"
#include "autotrade/domain/records.hpp"
#include "autotrade/domain/research.hpp"
#include "autotrade/domain/settings.hpp"
#include "autotrade/engine/drive.hpp"
#include "autotrade/execution/i_order_gateway.hpp"
#include "autotrade/market/i_market_data_source.hpp"
#include "autotrade/metrics/i_metrics_sink.hpp"
#include "autotrade/network/i_broadcast_sink.hpp"
#include "autotrade/research/i_research_provider.hpp"
#include "autotrade/risk/risk_manager.hpp"
#include "autotrade/store/i_record_store.hpp"
#include "autotrade/strategy/i_strategy_runner.hpp"
#include "autotrade/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace autotrade {

struct OrchestratorOptions {
  std::chrono::milliseconds exit_check_interval{2000};
  std::size_t book_depth{20};
  // Fraction passed to canTrade(); nullopt uses RiskLimits::default_adverse_move.
  std::optional<double> assumed_adverse_move;
  // Strategy owned by QuoteEngine; never executed by the orchestrator.
  std::string quote_engine_strategy{"market_making_hft"};
};

struct OrchestratorStatus {
  bool running{false};
  std::string symbol;
  std::int64_t interval_ms{0};
};

// -----------------------------------------------------------------------------
// ExecutionOrchestrator
// -----------------------------------------------------------------------------
//
// @brief  Periodic research → decision gate → risk → strategy → order →
//         bookkeeping loop for one user, plus an exit monitor for the
//         positions it opens.
//
// @details
// Cycle (immediately on start, then every interval):
//
//   1. IResearchProvider::runResearch(); broadcast a ResearchEvent.
//   2. Settings from the store; missing settings mean threshold 0.85 and
//      auto-trade disabled.
//   3. Gate, first failure wins, each writing one SKIPPED record:
//        accuracy < threshold  "Accuracy X% below threshold Y%"
//        auto-trade disabled   "Auto-trade disabled"
//        HOLD signal           "HOLD signal"
//   4. Execute: fresh book, canTrade(user, symbol, quote_size, mid, adverse).
//      Denial → SKIPPED with the risk reason plus a RiskAlertEvent. The
//      quote-engine strategy is refused. Otherwise the strategy is
//      initialized (repeat initialization is expected and ignored) and run.
//   5. BUY/SELL → placeOrder(). A returned order records a successful trade
//      result, a trade, user and global counters, an EXECUTED record, a
//      TRADE_EXECUTED activity, a metrics sample and the broadcasts.
//   6. HOLD or no decision → SKIPPED with the strategy's reason.
//   7. A std::exception during 4-6 records a failed trade result and a
//      failed metric, then SKIPPED "Execution error: <what>".
//   8. Exit monitor, at most once per exit_check_interval: stop-loss, then
//      take-profit, then TTL on each open position; a hit closes the
//      position and writes a CLOSED record. Needs an IPositionManager.
//
// Nothing that happens inside a cycle stops the loop; only stop() does.
//
// Thread model:
//   Cycles run on the PeriodicTask worker (Drive::Threaded) or the caller
//   of runCycle() (Drive::Manual). Configuration setters are for the
//   composition phase, before start(). stop() and getStatus() are safe from
//   any thread; stop() from the worker itself does not join. A cycle
//   re-checks running() after every collaborator call and abandons the rest
//   of its work once stopped; an order already placed is still recorded.
// -----------------------------------------------------------------------------
class ExecutionOrchestrator {
 public:
  ExecutionOrchestrator(std::string user_id, RiskManager& risk,
                        IResearchProvider& research, IMarketDataSource& market,
                        IOrderGateway& orders, IStrategyRunner& strategies,
                        IRecordStore& store, const ITimeProvider& clock,
                        OrchestratorOptions options = {},
                        Drive drive = Drive::Threaded);

  ~ExecutionOrchestrator();

  ExecutionOrchestrator(const ExecutionOrchestrator&) = delete;
  ExecutionOrchestrator& operator=(const ExecutionOrchestrator&) = delete;
  ExecutionOrchestrator(ExecutionOrchestrator&&) = delete;
  ExecutionOrchestrator& operator=(ExecutionOrchestrator&&) = delete;

  // Capability: without it the exit monitor is skipped.
  void setPositionManager(IPositionManager* positions) {
    positions_ = positions;
  }
  void setMetricsSink(IMetricsSink* metrics) { metrics_ = metrics; }
  void setBroadcastSink(IBroadcastSink* sink) { broadcast_ = sink; }
  // Receives an ExecutionEvent for every EXECUTED trade only.
  void setAdminSink(IBroadcastSink* sink) { admin_ = sink; }

  // -------------------------------------------------------------------------
  // start(symbol, interval)
  // -------------------------------------------------------------------------
  // @throws ConfigurationError for an empty user id, an empty symbol or a
  //         non-positive interval.
  // @throws std::logic_error if already running.
  // -------------------------------------------------------------------------
  void start(const std::string& symbol, std::chrono::milliseconds interval);

  // Idempotent. Joins the worker unless called from it.
  void stop();

  // Drive::Manual: runs one cycle on the caller's thread. No-op when idle.
  void runCycle();

  OrchestratorStatus getStatus() const;

  bool running() const { return running_.load(); }

  const std::string& userId() const { return user_id_; }

 private:
  std::chrono::milliseconds tick();

  void cycle();

  void executeTrade(const std::string& symbol,
                    const domain::ResearchResult& research,
                    const domain::TradingSettings& settings,
                    std::int64_t cycle_start_ms);

  void recordExecution(const std::string& symbol,
                       const domain::ResearchResult& research,
                       const std::string& strategy,
                       const domain::TradeDecision& decision,
                       const domain::Order& order,
                       std::int64_t cycle_start_ms);

  void monitorExits(const std::string& symbol);

  domain::ExecutionLogRecord skipRecord(const std::string& symbol,
                                        const domain::ResearchResult& research,
                                        std::string reason) const;

  // Persists the record, then broadcasts it.
  void writeLog(const domain::ExecutionLogRecord& record);

  void publish(IBroadcastSink* sink, const Event& event);

  const std::string user_id_;
  RiskManager& risk_;
  IResearchProvider& research_;
  IMarketDataSource& market_;
  IOrderGateway& orders_;
  IStrategyRunner& strategies_;
  IRecordStore& store_;
  const ITimeProvider& clock_;
  const OrchestratorOptions options_;
  const Drive drive_;

  IPositionManager* positions_{nullptr};
  IMetricsSink* metrics_{nullptr};
  IBroadcastSink* broadcast_{nullptr};
  IBroadcastSink* admin_{nullptr};

  std::atomic<bool> running_{false};

  mutable std::mutex status_mutex_;  // guards symbol_ and interval_
  std::string symbol_;
  std::chrono::milliseconds interval_{0};

  // Worker-only.
  std::optional<std::int64_t> last_exit_check_ms_;

  PeriodicTask task_;
};

}  // namespace autotrade

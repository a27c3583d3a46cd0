#pragma once

#include "autotrade/concurrent/latest_value.hpp"
#include "autotrade/concurrent/periodic_task.hpp"
#include "autotrade/concurrent/timer_service.hpp"
#include "autotrade/domain/order.hpp"
#include "autotrade/domain/orderbook.hpp"
#include "autotrade/engine/drive.hpp"
#include "autotrade/execution/i_order_gateway.hpp"
#include "autotrade/market/i_market_data_source.hpp"
#include "autotrade/metrics/i_metrics_sink.hpp"
#include "autotrade/network/i_broadcast_sink.hpp"
#include "autotrade/risk/i_account_provider.hpp"
#include "autotrade/risk/risk_manager.hpp"
#include "autotrade/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace autotrade {

// Immutable for one run of a QuoteEngine.
struct EngineConfig {
  std::string symbol;
  double quote_size{0.001};
  double adverse_move_pct{0.0002};  // fraction of mid, 0.0002 = 2 bps
  std::int64_t cancel_interval_ms{40};
  double max_position_size{0.01};
};

struct QuoteEngineOptions {
  std::chrono::milliseconds loop_interval{100};
  std::chrono::milliseconds error_backoff{1000};
  // Quotes sit this fraction of the half-spread away from mid.
  double quote_inside_factor{0.5};
  std::size_t book_depth{20};
  // Strategy label used for metrics.
  std::string strategy_name{"market_making_hft"};
};

// -----------------------------------------------------------------------------
// QuoteState: the one active two-sided quote of an engine
// -----------------------------------------------------------------------------
// Either side may be missing (inventory limit, rejected placement) but never
// both. sequence increases with every placement and keys the cancel timers.
// -----------------------------------------------------------------------------
struct QuoteState {
  std::optional<domain::OrderId> bid_order_id;
  std::optional<domain::OrderId> ask_order_id;
  std::int64_t placed_at_ms{0};
  double baseline_mid{0.0};
  std::uint64_t sequence{0};
};

struct QuoteEngineStatus {
  bool running{false};
  std::optional<EngineConfig> config;
  std::optional<QuoteState> quote;
};

// -----------------------------------------------------------------------------
// QuoteEngine
// -----------------------------------------------------------------------------
//
// @brief  Market-making loop for one symbol of one user: keeps a resting
//         bid/ask pair inside the touch, pulls it on adverse moves and
//         refreshes it when it goes stale.
//
// @details
// Cycle (every loop_interval, error_backoff after an exception):
//
//   1. RiskManager::canTrade(user, symbol, quote_size); denial ends the cycle.
//   2. Order book: newest pushed snapshot if the feed delivered one since the
//      last cycle, else getOrderbook(symbol, book_depth). A one-sided book
//      or a locked/crossed book (spread ≤ 0) ends the cycle.
//   3. Adverse-selection guard: a quote younger than cancel_interval_ms
//      whose baseline mid moved by more than adverse_move_pct is cancelled
//      and nothing is placed this cycle.
//   4. Re-quote when there is no quote or it is older than
//      2 × cancel_interval_ms. The old quote is always cancelled before the
//      new one is placed, so at most one bid and one ask id are live.
//      bid = mid − half_spread × inside_factor, placed only while
//      position + size ≤ max; ask = mid + half_spread × inside_factor,
//      placed only while position − size ≥ −max. Each placed side arms a
//      cancel timer at cancel_interval_ms.
//
// Cancel timers capture (run generation, quote sequence). stop() bumps the
// generation and every re-quote bumps the sequence, so a timer that fires
// for a replaced or stopped quote does nothing.
//
// Thread model:
//   One PeriodicTask worker runs the cycles; one TimerService thread runs
//   cancel timers. mutex_ serializes the quote-state part of a cycle, timer
//   callbacks and stop(), and is held across placeOrder()/cancelOrder() so
//   a side can never have two live orders. The risk check and the book
//   fetch happen outside mutex_: a risk pause stops this engine from the
//   checking thread. getStatus() reads a snapshot under its own lock and
//   never waits on venue calls. stop() may be called from any thread,
//   including this engine's worker.
//
// Ownership:
//   Holds references to RiskManager, IOrderGateway, IAccountProvider and
//   the clock; all must outlive the engine. The market source, feed and
//   sinks are non-owning as well.
// -----------------------------------------------------------------------------
class QuoteEngine {
 public:
  QuoteEngine(std::string user_id, RiskManager& risk, IOrderGateway& orders,
              IAccountProvider& accounts, const ITimeProvider& clock,
              QuoteEngineOptions options = {}, Drive drive = Drive::Threaded);

  // RAII: stop() if still running.
  ~QuoteEngine();

  QuoteEngine(const QuoteEngine&) = delete;
  QuoteEngine& operator=(const QuoteEngine&) = delete;
  QuoteEngine(QuoteEngine&&) = delete;
  QuoteEngine& operator=(QuoteEngine&&) = delete;

  // Optional observers; set before start().
  void setMetricsSink(IMetricsSink* metrics) { metrics_ = metrics; }
  void setBroadcastSink(IBroadcastSink* sink) { broadcast_ = sink; }

  // -------------------------------------------------------------------------
  // start(config, market, feed)
  // -------------------------------------------------------------------------
  // @brief  Stopped → Running.
  //
  // @param  feed  Optional push source; when set the engine subscribes for
  //               config.symbol and prefers pushed snapshots over pulls.
  //
  // @throws ConfigurationError if the engine has no user id or the config
  //         is invalid (empty symbol, non-positive size or interval,
  //         negative max position).
  // @throws std::logic_error if already running.
  //
  // Side-effects: Spawns the worker (Drive::Threaded).
  // -------------------------------------------------------------------------
  void start(const EngineConfig& config, IMarketDataSource& market,
             IOrderbookFeed* feed = nullptr);

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Running → Stopped. Cancels both sides of the active quote
  //         independently (failures logged), drops pending timers, clears
  //         the quote state.
  //
  // Idempotent. Joins the worker unless called from it.
  // -------------------------------------------------------------------------
  void stop();

  // Runs one cycle on the caller's thread. No-op when not running.
  // Drive::Manual only; returns the delay the worker would sleep.
  std::chrono::milliseconds runCycle();

  QuoteEngineStatus getStatus() const;

  bool running() const { return running_.load(); }

  const std::string& userId() const { return user_id_; }

  std::size_t pendingTimers() const { return timers_.pending(); }

 private:
  // Cycle entry point; turns exceptions into a backoff delay.
  std::chrono::milliseconds tick();

  void cycle();

  void requoteLocked(double mid, double spread, double position,
                     std::int64_t now);

  std::optional<domain::OrderId> placeSideLocked(domain::Side side,
                                                 double price);

  void cancelQuoteLocked(const std::string& reason);

  void onCancelTimer(std::uint64_t generation, std::uint64_t sequence);

  // Copies config and quote into the getStatus() snapshot. Caller holds
  // mutex_.
  void publishStatusLocked();

  void publish(const Event& event);

  static void validate(const EngineConfig& config);

  const std::string user_id_;
  RiskManager& risk_;
  IOrderGateway& orders_;
  IAccountProvider& accounts_;
  const ITimeProvider& clock_;
  const QuoteEngineOptions options_;
  const Drive drive_;

  IMetricsSink* metrics_{nullptr};
  IBroadcastSink* broadcast_{nullptr};

  std::atomic<bool> running_{false};

  // Written by start() before the worker exists, read by cycles.
  EngineConfig config_;
  IMarketDataSource* market_{nullptr};
  IOrderbookFeed* feed_{nullptr};
  IOrderbookFeed::SubscriptionId feed_subscription_{0};
  LatestValue<domain::Orderbook> latest_book_;

  mutable std::mutex mutex_;  // guards everything below
  bool has_config_{false};
  std::optional<QuoteState> quote_;
  std::vector<TimerService::TimerId> quote_timers_;
  std::uint64_t generation_{0};
  std::uint64_t next_sequence_{1};

  // getStatus() reads only these; lock order is mutex_ then status_mutex_.
  mutable std::mutex status_mutex_;
  std::optional<EngineConfig> status_config_;
  std::optional<QuoteState> status_quote_;

  // Destroyed before the state their callbacks touch.
  TimerService timers_;
  PeriodicTask task_;
};

}  // namespace autotrade

#include "autotrade/engine/execution_orchestrator.hpp"
#include "autotrade/domain/errors.hpp"
#include "autotrade/events/event_types.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace autotrade {

namespace {

std::string percent(double fraction) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << fraction * 100.0 << "%";
  return out.str();
}

}  // namespace

ExecutionOrchestrator::ExecutionOrchestrator(
    std::string user_id, RiskManager& risk, IResearchProvider& research,
    IMarketDataSource& market, IOrderGateway& orders,
    IStrategyRunner& strategies, IRecordStore& store,
    const ITimeProvider& clock, OrchestratorOptions options, Drive drive)
    : user_id_(std::move(user_id)),
      risk_(risk),
      research_(research),
      market_(market),
      orders_(orders),
      strategies_(strategies),
      store_(store),
      clock_(clock),
      options_(std::move(options)),
      drive_(drive),
      task_("orchestrator:" + user_id_) {}

ExecutionOrchestrator::~ExecutionOrchestrator() { stop(); }

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void ExecutionOrchestrator::start(const std::string& symbol,
                                  std::chrono::milliseconds interval) {
  if (user_id_.empty()) {
    throw ConfigurationError("ExecutionOrchestrator requires a user context");
  }
  if (symbol.empty()) {
    throw ConfigurationError("ExecutionOrchestrator symbol must not be empty");
  }
  if (interval.count() <= 0) {
    throw ConfigurationError("ExecutionOrchestrator interval must be positive");
  }

  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    throw std::logic_error("ExecutionOrchestrator already running for user " +
                           user_id_);
  }

  {
    std::lock_guard lock(status_mutex_);
    symbol_ = symbol;
    interval_ = interval;
  }
  last_exit_check_ms_.reset();

  if (drive_ == Drive::Threaded) {
    task_.start([this] { return tick(); });
  }

  std::cout << "[ExecutionOrchestrator] started user=" << user_id_
            << " symbol=" << symbol << " interval_ms=" << interval.count()
            << "\n";
}

void ExecutionOrchestrator::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  task_.stop();
  std::cout << "[ExecutionOrchestrator] stopped user=" << user_id_ << "\n";
}

void ExecutionOrchestrator::runCycle() { tick(); }

OrchestratorStatus ExecutionOrchestrator::getStatus() const {
  OrchestratorStatus status;
  status.running = running_.load();
  std::lock_guard lock(status_mutex_);
  status.symbol = symbol_;
  status.interval_ms = interval_.count();
  return status;
}

// -----------------------------------------------------------------------------
// tick(): cycle with the error boundary
// -----------------------------------------------------------------------------
std::chrono::milliseconds ExecutionOrchestrator::tick() {
  std::chrono::milliseconds interval{0};
  {
    std::lock_guard lock(status_mutex_);
    interval = interval_;
  }
  if (!running_.load()) {
    return interval;
  }

  try {
    cycle();
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionOrchestrator] cycle failed user=" << user_id_
              << ": " << e.what() << "\n";
  }
  return interval;
}

void ExecutionOrchestrator::cycle() {
  std::string symbol;
  {
    std::lock_guard lock(status_mutex_);
    symbol = symbol_;
  }
  const std::int64_t cycle_start = clock_.now_ms();

  // --- 1) Research -----------------------------------------------------------
  const domain::ResearchResult research =
      research_.runResearch(symbol, user_id_, market_);
  if (!running_.load()) {
    return;
  }
  publish(broadcast_, ResearchEvent{user_id_, research});

  // --- 2) Settings -----------------------------------------------------------
  const std::optional<domain::TradingSettings> stored =
      store_.getSettings(user_id_);
  const domain::TradingSettings settings =
      stored ? *stored : domain::TradingSettings{};
  if (!running_.load()) {
    return;
  }

  // --- 3) Gate ---------------------------------------------------------------
  std::optional<std::string> skip;
  if (research.accuracy < settings.min_accuracy_threshold) {
    skip = "Accuracy " + percent(research.accuracy) + " below threshold " +
           percent(settings.min_accuracy_threshold);
  } else if (!settings.auto_trade_enabled) {
    skip = "Auto-trade disabled";
  } else if (research.signal == domain::Signal::Hold) {
    skip = "HOLD signal";
  }

  if (skip) {
    domain::ExecutionLogRecord record = skipRecord(symbol, research, *skip);
    record.min_accuracy_threshold = settings.min_accuracy_threshold;
    record.strategy = settings.strategy;
    writeLog(record);
  } else {
    executeTrade(symbol, research, settings, cycle_start);
  }

  // --- 8) Exit monitor -------------------------------------------------------
  if (!running_.load()) {
    return;
  }
  monitorExits(symbol);
}

// -----------------------------------------------------------------------------
// executeTrade(): steps 4-7
// -----------------------------------------------------------------------------
void ExecutionOrchestrator::executeTrade(
    const std::string& symbol, const domain::ResearchResult& research,
    const domain::TradingSettings& settings, std::int64_t cycle_start_ms) {
  const std::string& strategy = settings.strategy;

  try {
    const domain::Orderbook book =
        market_.getOrderbook(symbol, options_.book_depth);
    if (!running_.load()) {
      return;
    }

    const RiskDecision decision =
        risk_.canTrade(user_id_, symbol, settings.quote_size, book.mid(),
                       options_.assumed_adverse_move);
    // A pause raised by this check stops us; the denial is still logged.
    if (!decision.allowed) {
      const std::string reason = decision.reason.value_or("Risk check failed");
      std::cerr << "[ExecutionOrchestrator] trade blocked by risk user="
                << user_id_ << " reason=\"" << reason << "\"\n";

      domain::ExecutionLogRecord record = skipRecord(symbol, research, reason);
      record.strategy = strategy;
      writeLog(record);
      publish(broadcast_,
              RiskAlertEvent{user_id_, symbol, reason, clock_.now_ms()});
      return;
    }

    if (strategy == options_.quote_engine_strategy) {
      std::cerr << "[ExecutionOrchestrator] " << strategy
                << " runs in the quote engine only user=" << user_id_ << "\n";
      domain::ExecutionLogRecord record = skipRecord(
          symbol, research, "Strategy " + strategy + " runs in quote engine");
      record.strategy = strategy;
      writeLog(record);
      return;
    }
    if (!running_.load()) {
      return;
    }

    StrategyConfig config;
    config.symbol = symbol;
    config.quote_size = settings.quote_size;
    config.adverse_pct = settings.adverse_pct;
    config.cancel_ms = settings.cancel_ms;
    if (settings.max_position && *settings.max_position > 0.0) {
      config.max_position = *settings.max_position;
    }
    config.stop_loss_pct = settings.stop_loss_pct;
    config.take_profit_pct = settings.take_profit_pct;
    config.position_ttl_ms = settings.position_ttl_ms;

    try {
      strategies_.initializeStrategy(user_id_, strategy, config, market_,
                                     orders_);
    } catch (const StrategyAlreadyInitializedError&) {
      // Every cycle after the first lands here.
    }

    const std::optional<domain::TradeDecision> trade =
        strategies_.executeStrategy(user_id_, strategy, research, book);

    if (!trade || !domain::isActionable(*trade)) {
      domain::ExecutionLogRecord record = skipRecord(
          symbol, research,
          trade ? trade->reason.value_or("Strategy returned HOLD")
                : "Strategy returned HOLD");
      record.strategy = strategy;
      writeLog(record);
      return;
    }

    // Last point to abandon: once placed, the order is always recorded.
    if (!running_.load()) {
      return;
    }

    domain::OrderRequest request;
    request.symbol = symbol;
    request.side = domain::toSide(trade->action);
    request.type = trade->order_type;
    request.quantity = trade->quantity;
    request.price = trade->price;
    request.stop_loss = trade->stop_loss;
    request.take_profit = trade->take_profit;
    request.ttl_ms = trade->ttl_ms;

    const std::optional<domain::Order> order =
        orders_.placeOrder(user_id_, request);
    if (!order) {
      domain::ExecutionLogRecord record =
          skipRecord(symbol, research, "Order was not accepted");
      record.strategy = strategy;
      writeLog(record);
      return;
    }

    recordExecution(symbol, research, strategy, *trade, *order,
                    cycle_start_ms);

  } catch (const std::exception& e) {
    std::cerr << "[ExecutionOrchestrator] execution error user=" << user_id_
              << " symbol=" << symbol << ": " << e.what() << "\n";

    if (metrics_ != nullptr) {
      metrics_->recordTrade(user_id_, strategy, false, std::nullopt);
    }
    risk_.recordTradeResult(user_id_, 0.0, false);

    domain::ExecutionLogRecord record = skipRecord(
        symbol, research, std::string("Execution error: ") + e.what());
    record.strategy = strategy;
    writeLog(record);
  }
}

// -----------------------------------------------------------------------------
// recordExecution(): bookkeeping for a returned order
// -----------------------------------------------------------------------------
void ExecutionOrchestrator::recordExecution(
    const std::string& symbol, const domain::ResearchResult& research,
    const std::string& strategy, const domain::TradeDecision& decision,
    const domain::Order& order, std::int64_t cycle_start_ms) {
  const std::int64_t now = clock_.now_ms();
  const std::int64_t latency = now - cycle_start_ms;
  const double fill_price = order.avg_price.value_or(
      order.price > 0.0 ? order.price : decision.price);
  const double slippage =
      decision.price > 0.0
          ? std::abs(fill_price - decision.price) / decision.price
          : 0.0;

  risk_.recordTradeResult(user_id_, 0.0, true);

  domain::TradeRecord trade;
  trade.user_id = user_id_;
  trade.symbol = symbol;
  trade.side = order.side;
  trade.quantity = order.quantity;
  trade.price = fill_price;
  trade.order_id = order.id;
  trade.strategy = strategy;
  trade.timestamp_ms = now;
  const std::string trade_id = store_.saveTrade(user_id_, trade);

  domain::UserStats user =
      store_.getUser(user_id_).value_or(domain::UserStats{user_id_, 0, 0});
  user.user_id = user_id_;
  ++user.total_trades;
  user.last_trade_ms = now;
  store_.createOrUpdateUser(user);

  domain::GlobalStats global = store_.getGlobalStats();
  ++global.total_trades;
  store_.updateGlobalStats(global);

  domain::ExecutionLogRecord record;
  record.user_id = user_id_;
  record.symbol = symbol;
  record.action = domain::ExecutionAction::Executed;
  record.reason = decision.reason.value_or("");
  record.signal = research.signal;
  record.accuracy = research.accuracy;
  record.strategy = strategy;
  record.side = order.side;
  record.quantity = order.quantity;
  record.price = fill_price;
  record.order_id = order.id;
  record.trade_id = trade_id;
  record.latency_ms = latency;
  record.slippage = slippage;
  record.timestamp_ms = now;
  writeLog(record);

  std::ostringstream message;
  message << "Auto-trade executed: " << domain::toString(order.side) << " "
          << order.quantity << " " << symbol << " at " << fill_price;
  nlohmann::json payload;
  payload["message"] = message.str();
  payload["symbol"] = symbol;
  payload["side"] = domain::toString(order.side);
  payload["price"] = fill_price;
  payload["quantity"] = order.quantity;
  payload["order_id"] = order.id;
  payload["trade_id"] = trade_id;
  store_.logActivity(user_id_, "TRADE_EXECUTED", payload);

  if (metrics_ != nullptr) {
    metrics_->recordTrade(user_id_, strategy, true, latency);
  }
  publish(admin_, ExecutionEvent{user_id_, record});

  std::cout << "[ExecutionOrchestrator] trade executed user=" << user_id_
            << " symbol=" << symbol << " order=" << order.id
            << " side=" << domain::toString(order.side)
            << " qty=" << order.quantity << " price=" << fill_price
            << " accuracy=" << research.accuracy << " strategy=" << strategy
            << "\n";
}

// -----------------------------------------------------------------------------
// monitorExits(): stop-loss, take-profit, TTL
// -----------------------------------------------------------------------------
void ExecutionOrchestrator::monitorExits(const std::string& symbol) {
  if (positions_ == nullptr) {
    return;
  }

  const std::int64_t now = clock_.now_ms();
  if (last_exit_check_ms_ &&
      now - *last_exit_check_ms_ < options_.exit_check_interval.count()) {
    return;
  }
  last_exit_check_ms_ = now;

  try {
    const std::optional<double> mid = market_.getOrderbook(symbol, 5).mid();
    if (!mid || *mid <= 0.0) {
      return;
    }

    for (const domain::OpenPosition& pos :
         positions_->getOpenPositions(user_id_, symbol)) {
      if (pos.quantity <= 0.0) {
        continue;
      }
      const bool is_long = pos.side == domain::Side::Buy;

      std::optional<std::string> reason;
      if (pos.stop_loss &&
          (is_long ? *mid <= *pos.stop_loss : *mid >= *pos.stop_loss)) {
        reason = "Stop loss hit";
      } else if (pos.take_profit && (is_long ? *mid >= *pos.take_profit
                                             : *mid <= *pos.take_profit)) {
        reason = "Take profit hit";
      } else if (pos.ttl_ms && now - pos.opened_at_ms >= *pos.ttl_ms) {
        reason = "Time-based exit";
      }

      if (!reason) {
        continue;
      }

      try {
        positions_->closePosition(user_id_, symbol, pos.id);

        domain::ExecutionLogRecord record;
        record.user_id = user_id_;
        record.symbol = symbol;
        record.action = domain::ExecutionAction::Closed;
        record.reason = *reason;
        record.side = pos.side;
        record.quantity = pos.quantity;
        record.price = *mid;
        record.position_id = pos.id;
        record.timestamp_ms = clock_.now_ms();
        writeLog(record);

        std::cout << "[ExecutionOrchestrator] position closed user="
                  << user_id_ << " position=" << pos.id << " reason=\""
                  << *reason << "\"\n";
      } catch (const std::exception& e) {
        std::cerr << "[ExecutionOrchestrator] failed to close position user="
                  << user_id_ << " position=" << pos.id << ": " << e.what()
                  << "\n";
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionOrchestrator] exit monitor skipped user="
              << user_id_ << ": " << e.what() << "\n";
  }
}

domain::ExecutionLogRecord ExecutionOrchestrator::skipRecord(
    const std::string& symbol, const domain::ResearchResult& research,
    std::string reason) const {
  domain::ExecutionLogRecord record;
  record.user_id = user_id_;
  record.symbol = symbol;
  record.action = domain::ExecutionAction::Skipped;
  record.reason = std::move(reason);
  record.signal = research.signal;
  record.accuracy = research.accuracy;
  record.timestamp_ms = clock_.now_ms();
  return record;
}

void ExecutionOrchestrator::writeLog(const domain::ExecutionLogRecord& record) {
  store_.saveExecutionLog(user_id_, record);
  publish(broadcast_, ExecutionEvent{user_id_, record});
}

void ExecutionOrchestrator::publish(IBroadcastSink* sink, const Event& event) {
  if (sink == nullptr) {
    return;
  }
  try {
    sink->broadcast(event);
  } catch (const std::exception& e) {
    std::cerr << "[ExecutionOrchestrator] broadcast failed user=" << user_id_
              << ": " << e.what() << "\n";
  }
}

}  // namespace autotrade

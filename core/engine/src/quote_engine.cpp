#include "autotrade/engine/quote_engine.hpp"
#include "autotrade/domain/errors.hpp"
#include "autotrade/events/event_types.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace autotrade {

QuoteEngine::QuoteEngine(std::string user_id, RiskManager& risk,
                         IOrderGateway& orders, IAccountProvider& accounts,
                         const ITimeProvider& clock,
                         QuoteEngineOptions options, Drive drive)
    : user_id_(std::move(user_id)),
      risk_(risk),
      orders_(orders),
      accounts_(accounts),
      clock_(clock),
      options_(std::move(options)),
      drive_(drive),
      timers_("quote-timers:" + user_id_),
      task_("quote-engine:" + user_id_) {}

QuoteEngine::~QuoteEngine() { stop(); }

void QuoteEngine::validate(const EngineConfig& config) {
  if (config.symbol.empty()) {
    throw ConfigurationError("EngineConfig.symbol must not be empty");
  }
  if (!(config.quote_size > 0.0)) {
    throw ConfigurationError("EngineConfig.quote_size must be positive");
  }
  if (config.cancel_interval_ms <= 0) {
    throw ConfigurationError("EngineConfig.cancel_interval_ms must be positive");
  }
  if (config.adverse_move_pct < 0.0 || config.max_position_size < 0.0) {
    throw ConfigurationError(
        "EngineConfig.adverse_move_pct and max_position_size must not be "
        "negative");
  }
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void QuoteEngine::start(const EngineConfig& config, IMarketDataSource& market,
                        IOrderbookFeed* feed) {
  if (user_id_.empty()) {
    throw ConfigurationError("QuoteEngine requires a user context");
  }
  validate(config);

  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    throw std::logic_error("QuoteEngine already running for user " + user_id_);
  }

  market_ = &market;
  latest_book_.clear();
  {
    std::lock_guard lock(mutex_);
    config_ = config;
    has_config_ = true;
    quote_.reset();
    quote_timers_.clear();
    ++generation_;
    publishStatusLocked();
  }

  feed_ = feed;
  if (feed_ != nullptr) {
    feed_subscription_ = feed_->subscribeOrderbook(
        config_.symbol,
        [this](const domain::Orderbook& book) { latest_book_.store(book); });
  }

  if (drive_ == Drive::Threaded) {
    task_.start([this] { return tick(); });
  }

  std::cout << "[QuoteEngine] started user=" << user_id_
            << " symbol=" << config_.symbol << " size=" << config_.quote_size
            << " adverse_pct=" << config_.adverse_move_pct
            << " cancel_ms=" << config_.cancel_interval_ms
            << " max_pos=" << config_.max_position_size << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void QuoteEngine::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // Joins the worker (or only flags it when called from the worker), so no
  // cycle holds mutex_ past this point.
  task_.stop();

  if (feed_ != nullptr) {
    feed_->unsubscribe(feed_subscription_);
    feed_ = nullptr;
  }
  latest_book_.clear();

  {
    std::lock_guard lock(mutex_);
    ++generation_;
    cancelQuoteLocked("engine stopped");
    timers_.cancelAll();
    quote_timers_.clear();
    publishStatusLocked();
  }

  std::cout << "[QuoteEngine] stopped user=" << user_id_
            << " symbol=" << config_.symbol << "\n";
}

std::chrono::milliseconds QuoteEngine::runCycle() { return tick(); }

QuoteEngineStatus QuoteEngine::getStatus() const {
  QuoteEngineStatus status;
  status.running = running_.load();
  std::lock_guard lock(status_mutex_);
  status.config = status_config_;
  status.quote = status_quote_;
  return status;
}

// -----------------------------------------------------------------------------
// tick(): one cycle with the error boundary
// -----------------------------------------------------------------------------
std::chrono::milliseconds QuoteEngine::tick() {
  if (!running_.load()) {
    return options_.loop_interval;
  }

  try {
    cycle();
  } catch (const std::exception& e) {
    std::cerr << "[QuoteEngine] cycle failed user=" << user_id_
              << " symbol=" << config_.symbol << ": " << e.what() << "\n";
    // A placement that threw may have left half a quote behind.
    std::lock_guard lock(mutex_);
    publishStatusLocked();
    return options_.error_backoff;
  }
  return options_.loop_interval;
}

void QuoteEngine::cycle() {
  // --- 1) Risk gate, outside mutex_ -----------------------------------------
  const RiskDecision decision =
      risk_.canTrade(user_id_, config_.symbol, config_.quote_size);
  if (!decision.allowed) {
    return;
  }
  // A denial elsewhere may have paused the user while we were checking.
  if (!running_.load()) {
    return;
  }

  // --- 2) Book ---------------------------------------------------------------
  std::optional<domain::Orderbook> pushed = latest_book_.take();
  const domain::Orderbook book =
      pushed ? std::move(*pushed)
             : market_->getOrderbook(config_.symbol, options_.book_depth);

  const auto mid = book.mid();
  const auto spread = book.spread();
  if (!mid || !spread || *spread <= 0.0) {
    return;
  }

  const double position = accounts_.position(user_id_, config_.symbol);
  const std::int64_t now = clock_.now_ms();

  std::lock_guard lock(mutex_);
  if (!running_.load()) {
    return;
  }

  // --- 3) Adverse-selection guard -------------------------------------------
  if (quote_) {
    const std::int64_t age = now - quote_->placed_at_ms;
    const double move =
        quote_->baseline_mid > 0.0
            ? std::abs(*mid - quote_->baseline_mid) / quote_->baseline_mid
            : 0.0;
    if (age < config_.cancel_interval_ms && move > config_.adverse_move_pct) {
      std::cout << "[QuoteEngine] adverse move user=" << user_id_
                << " symbol=" << config_.symbol << " move=" << move
                << " age_ms=" << age << "\n";
      cancelQuoteLocked("adverse selection");
      return;
    }
  }

  // --- 4) Re-quote -----------------------------------------------------------
  if (!quote_ || now - quote_->placed_at_ms > 2 * config_.cancel_interval_ms) {
    requoteLocked(*mid, *spread, position, now);
  }
}

// -----------------------------------------------------------------------------
// requoteLocked(): cancel first, then place
// -----------------------------------------------------------------------------
void QuoteEngine::requoteLocked(double mid, double spread, double position,
                                std::int64_t now) {
  cancelQuoteLocked("requote");

  const double offset = (spread / 2.0) * options_.quote_inside_factor;
  const double bid_price = mid - offset;
  const double ask_price = mid + offset;

  // Tracked before any placement so a throwing ask leaves the bid owned.
  QuoteState next;
  next.placed_at_ms = now;
  next.baseline_mid = mid;
  next.sequence = next_sequence_++;
  quote_ = next;

  const std::uint64_t generation = generation_;
  const std::uint64_t sequence = next.sequence;
  auto armTimer = [&] {
    quote_timers_.push_back(timers_.schedule(
        std::chrono::milliseconds(config_.cancel_interval_ms),
        [this, generation, sequence] { onCancelTimer(generation, sequence); }));
  };

  if (position + config_.quote_size <= config_.max_position_size) {
    quote_->bid_order_id = placeSideLocked(domain::Side::Buy, bid_price);
    if (quote_->bid_order_id) {
      armTimer();
    }
  }

  // stop() may have landed while the bid was being placed.
  if (running_.load() &&
      position - config_.quote_size >= -config_.max_position_size) {
    quote_->ask_order_id = placeSideLocked(domain::Side::Sell, ask_price);
    if (quote_->ask_order_id) {
      armTimer();
    }
  }

  if (!quote_->bid_order_id && !quote_->ask_order_id) {
    quote_.reset();
    publishStatusLocked();
    return;
  }
  publishStatusLocked();

  QuoteUpdateEvent event;
  event.user_id = user_id_;
  event.symbol = config_.symbol;
  event.kind = QuoteUpdateEvent::Kind::Placed;
  event.bid_order_id = quote_->bid_order_id;
  event.ask_order_id = quote_->ask_order_id;
  if (quote_->bid_order_id) event.bid_price = bid_price;
  if (quote_->ask_order_id) event.ask_price = ask_price;
  event.mid = mid;
  event.reason = "requote";
  event.sequence = sequence;
  event.timestamp_ms = now;
  publish(event);
}

std::optional<domain::OrderId> QuoteEngine::placeSideLocked(domain::Side side,
                                                            double price) {
  domain::OrderRequest request;
  request.symbol = config_.symbol;
  request.side = side;
  request.type = domain::OrderType::Limit;
  request.quantity = config_.quote_size;
  request.price = price;

  std::optional<domain::Order> order = orders_.placeOrder(user_id_, request);
  if (!order) {
    std::cerr << "[QuoteEngine] " << domain::toString(side)
              << " quote rejected user=" << user_id_
              << " symbol=" << config_.symbol << " price=" << price << "\n";
    return std::nullopt;
  }
  return order->id;
}

// -----------------------------------------------------------------------------
// cancelQuoteLocked(): best effort, each side on its own
// -----------------------------------------------------------------------------
void QuoteEngine::cancelQuoteLocked(const std::string& reason) {
  for (TimerService::TimerId id : quote_timers_) {
    timers_.cancel(id);
  }
  quote_timers_.clear();

  if (!quote_) {
    return;
  }
  const QuoteState cancelled = *quote_;
  quote_.reset();
  publishStatusLocked();

  for (const auto& id : {cancelled.bid_order_id, cancelled.ask_order_id}) {
    if (!id) {
      continue;
    }
    try {
      orders_.cancelOrder(*id);
      if (metrics_ != nullptr) {
        metrics_->recordCancel(user_id_, options_.strategy_name);
      }
    } catch (const std::exception& e) {
      std::cerr << "[QuoteEngine] cancel failed user=" << user_id_
                << " order=" << *id << ": " << e.what() << "\n";
    }
  }

  QuoteUpdateEvent event;
  event.user_id = user_id_;
  event.symbol = config_.symbol;
  event.kind = QuoteUpdateEvent::Kind::Canceled;
  event.bid_order_id = cancelled.bid_order_id;
  event.ask_order_id = cancelled.ask_order_id;
  event.mid = cancelled.baseline_mid;
  event.reason = reason;
  event.sequence = cancelled.sequence;
  event.timestamp_ms = clock_.now_ms();
  publish(event);
}

// -----------------------------------------------------------------------------
// onCancelTimer(): timer thread
// -----------------------------------------------------------------------------
void QuoteEngine::onCancelTimer(std::uint64_t generation,
                                std::uint64_t sequence) {
  std::lock_guard lock(mutex_);
  if (generation != generation_ || !quote_ || quote_->sequence != sequence) {
    return;  // stale: engine restarted, stopped or re-quoted
  }
  cancelQuoteLocked("cancel interval elapsed");
}

void QuoteEngine::publishStatusLocked() {
  std::lock_guard lock(status_mutex_);
  if (has_config_) {
    status_config_ = config_;
  }
  status_quote_ = quote_;
}

void QuoteEngine::publish(const Event& event) {
  if (broadcast_ == nullptr) {
    return;
  }
  try {
    broadcast_->broadcast(event);
  } catch (const std::exception& e) {
    std::cerr << "[QuoteEngine] broadcast failed user=" << user_id_ << ": "
              << e.what() << "\n";
  }
}

}  // namespace autotrade

#pragma once

// =============================================================================
// test_doubles.hpp
// =============================================================================
// Hand-written collaborators shared by the engine tests. Every double records
// what it was asked to do so tests can assert on call counts and arguments.
// All of them are thread-safe: engine tests run cycles on worker threads.
//
// Hooks (onPull, beforePlace, onRun, onExecute) run on the calling thread,
// outside the double's own lock, so they may call back into the engine.
// =============================================================================

#include "autotrade/domain/errors.hpp"
#include "autotrade/domain/orderbook.hpp"
#include "autotrade/events/event.hpp"
#include "autotrade/execution/i_order_gateway.hpp"
#include "autotrade/market/i_market_data_source.hpp"
#include "autotrade/network/i_broadcast_sink.hpp"
#include "autotrade/research/i_research_provider.hpp"
#include "autotrade/risk/i_account_provider.hpp"
#include "autotrade/risk/i_engine_lifecycle.hpp"
#include "autotrade/strategy/i_strategy_runner.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace autotrade::test {

// Two-sided book with one level per side.
inline domain::Orderbook makeBook(const std::string& symbol, double bid,
                                  double ask, double qty = 1.0) {
  domain::Orderbook book;
  book.symbol = symbol;
  book.bids.push_back({bid, qty});
  book.asks.push_back({ask, qty});
  return book;
}

// Book centred on mid with the given absolute spread.
inline domain::Orderbook bookAroundMid(const std::string& symbol, double mid,
                                       double spread, double qty = 1.0) {
  return makeBook(symbol, mid - spread / 2.0, mid + spread / 2.0, qty);
}

// =============================================================================
// FakeMarket: settable book, optional push delivery, optional failure.
// =============================================================================
class FakeMarket : public IMarketDataSource, public IOrderbookFeed {
 public:
  void setBook(domain::Orderbook book) {
    std::lock_guard lock(mutex_);
    book_ = std::move(book);
  }

  void failWith(std::string message) {
    std::lock_guard lock(mutex_);
    failure_ = std::move(message);
  }

  void onPull(std::function<void()> hook) {
    std::lock_guard lock(mutex_);
    pull_hook_ = std::move(hook);
  }

  domain::Orderbook getOrderbook(const std::string& symbol,
                                 std::size_t /*depth*/) override {
    ++pulls;
    runHook(pull_hook_);
    std::lock_guard lock(mutex_);
    if (failure_) {
      throw std::runtime_error(*failure_);
    }
    domain::Orderbook book = book_;
    book.symbol = symbol;
    return book;
  }

  SubscriptionId subscribeOrderbook(const std::string& symbol,
                                    Callback callback) override {
    std::lock_guard lock(mutex_);
    const SubscriptionId id = next_id_++;
    subscribers_[id] = {symbol, std::move(callback)};
    return id;
  }

  void unsubscribe(SubscriptionId id) override {
    std::lock_guard lock(mutex_);
    subscribers_.erase(id);
  }

  // Delivers a snapshot to every subscriber of its symbol.
  void push(const domain::Orderbook& book) {
    std::lock_guard lock(mutex_);
    for (auto& [id, sub] : subscribers_) {
      if (sub.first == book.symbol) {
        sub.second(book);
      }
    }
  }

  std::size_t subscriberCount() const {
    std::lock_guard lock(mutex_);
    return subscribers_.size();
  }

  std::atomic<int> pulls{0};

 private:
  void runHook(const std::function<void()>& hook) {
    std::function<void()> copy;
    {
      std::lock_guard lock(mutex_);
      copy = hook;
    }
    if (copy) {
      copy();
    }
  }

  mutable std::mutex mutex_;
  std::function<void()> pull_hook_;
  domain::Orderbook book_;
  std::optional<std::string> failure_;
  SubscriptionId next_id_{1};
  std::map<SubscriptionId, std::pair<std::string, Callback>> subscribers_;
};

// =============================================================================
// RecordingGateway: orders, cancels, positions and account in one double.
//
// Tracks the live (placed and not cancelled) order ids per side so tests can
// assert that no side ever has two live orders at once.
// =============================================================================
class RecordingGateway : public IOrderGateway,
                         public IPositionManager,
                         public IAccountProvider {
 public:
  std::optional<domain::Order> placeOrder(
      const std::string& user_id,
      const domain::OrderRequest& request) override {
    std::function<void()> hook;
    {
      std::lock_guard lock(mutex_);
      hook = place_hook_;
    }
    if (hook) {
      hook();
    }

    std::lock_guard lock(mutex_);
    if (place_failure_) {
      throw std::runtime_error(*place_failure_);
    }
    placed_.push_back(request);
    placed_users_.push_back(user_id);
    if (reject_all_) {
      return std::nullopt;
    }

    domain::Order order;
    order.id = "ord-" + std::to_string(next_id_++);
    order.symbol = request.symbol;
    order.side = request.side;
    order.type = request.type;
    order.quantity = request.quantity;
    order.price = request.price;
    order.avg_price = fill_price_;
    order.status = request.type == domain::OrderType::Market
                       ? domain::OrderStatus::Filled
                       : domain::OrderStatus::Accepted;

    if (request.type == domain::OrderType::Limit) {
      auto& live = live_[request.side];
      live.insert(order.id);
      max_live_per_side_ =
          std::max<std::size_t>(max_live_per_side_, live.size());
      side_of_[order.id] = request.side;
    }
    return order;
  }

  void cancelOrder(const domain::OrderId& order_id) override {
    std::lock_guard lock(mutex_);
    cancelled_.push_back(order_id);
    if (cancel_failure_) {
      throw std::runtime_error(*cancel_failure_);
    }
    auto it = side_of_.find(order_id);
    if (it != side_of_.end()) {
      live_[it->second].erase(order_id);
    }
  }

  std::vector<domain::OpenPosition> getOpenPositions(
      const std::string& /*user_id*/, const std::string& symbol) override {
    std::lock_guard lock(mutex_);
    std::vector<domain::OpenPosition> out;
    for (const auto& pos : open_positions_) {
      if (pos.symbol == symbol) {
        out.push_back(pos);
      }
    }
    return out;
  }

  void closePosition(const std::string& /*user_id*/,
                     const std::string& /*symbol*/,
                     const std::string& position_id) override {
    std::lock_guard lock(mutex_);
    closed_.push_back(position_id);
    open_positions_.erase(
        std::remove_if(open_positions_.begin(), open_positions_.end(),
                       [&](const auto& p) { return p.id == position_id; }),
        open_positions_.end());
  }

  double balance(const std::string& /*user_id*/) override {
    return balance_.load();
  }

  double position(const std::string& /*user_id*/,
                  const std::string& /*symbol*/) override {
    return position_.load();
  }

  // --- configuration -------------------------------------------------------
  void setBalance(double b) { balance_.store(b); }
  void setPosition(double p) { position_.store(p); }
  void setFillPrice(std::optional<double> p) {
    std::lock_guard lock(mutex_);
    fill_price_ = p;
  }
  void rejectAll(bool reject) {
    std::lock_guard lock(mutex_);
    reject_all_ = reject;
  }
  void failPlacement(std::string message) {
    std::lock_guard lock(mutex_);
    place_failure_ = std::move(message);
  }
  void beforePlace(std::function<void()> hook) {
    std::lock_guard lock(mutex_);
    place_hook_ = std::move(hook);
  }
  void failCancels(std::string message) {
    std::lock_guard lock(mutex_);
    cancel_failure_ = std::move(message);
  }
  void addOpenPosition(domain::OpenPosition pos) {
    std::lock_guard lock(mutex_);
    open_positions_.push_back(std::move(pos));
  }

  // --- inspection ----------------------------------------------------------
  std::vector<domain::OrderRequest> placed() const {
    std::lock_guard lock(mutex_);
    return placed_;
  }
  std::vector<domain::OrderId> cancelled() const {
    std::lock_guard lock(mutex_);
    return cancelled_;
  }
  std::vector<std::string> closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }
  std::size_t liveCount(domain::Side side) const {
    std::lock_guard lock(mutex_);
    auto it = live_.find(side);
    return it == live_.end() ? 0 : it->second.size();
  }
  std::size_t maxLivePerSide() const {
    std::lock_guard lock(mutex_);
    return max_live_per_side_;
  }

 private:
  mutable std::mutex mutex_;
  int next_id_{1};
  std::vector<domain::OrderRequest> placed_;
  std::vector<std::string> placed_users_;
  std::vector<domain::OrderId> cancelled_;
  std::vector<std::string> closed_;
  std::map<domain::Side, std::set<domain::OrderId>> live_;
  std::map<domain::OrderId, domain::Side> side_of_;
  std::size_t max_live_per_side_{0};
  std::vector<domain::OpenPosition> open_positions_;
  std::optional<double> fill_price_;
  bool reject_all_{false};
  std::optional<std::string> place_failure_;
  std::function<void()> place_hook_;
  std::optional<std::string> cancel_failure_;
  std::atomic<double> balance_{10000.0};
  std::atomic<double> position_{0.0};
};

// =============================================================================
// FixedResearch: returns a configurable result and counts calls.
// =============================================================================
class FixedResearch : public IResearchProvider {
 public:
  domain::ResearchResult runResearch(const std::string& symbol,
                                     const std::string& /*user_id*/,
                                     IMarketDataSource& /*market*/) override {
    ++calls;
    std::function<void()> hook;
    domain::ResearchResult r;
    {
      std::lock_guard lock(mutex_);
      hook = hook_;
      r = result_;
    }
    if (hook) {
      hook();
    }
    r.symbol = symbol;
    return r;
  }

  void onRun(std::function<void()> hook) {
    std::lock_guard lock(mutex_);
    hook_ = std::move(hook);
  }

  void set(domain::Signal signal, double accuracy) {
    std::lock_guard lock(mutex_);
    result_.signal = signal;
    result_.accuracy = accuracy;
  }

  std::atomic<int> calls{0};

 private:
  std::mutex mutex_;
  std::function<void()> hook_;
  domain::ResearchResult result_;
};

// =============================================================================
// ScriptedStrategies: IStrategyRunner returning a configured decision.
// The second initialization of the same (user, name) throws, like the real
// registry.
// =============================================================================
class ScriptedStrategies : public IStrategyRunner {
 public:
  void initializeStrategy(const std::string& user_id, const std::string& name,
                          const StrategyConfig& config,
                          IMarketDataSource& /*market*/,
                          IOrderGateway& /*orders*/) override {
    std::lock_guard lock(mutex_);
    ++init_calls;
    last_config = config;
    if (!initialized_.insert(user_id + "/" + name).second) {
      throw StrategyAlreadyInitializedError(name + " already initialized");
    }
  }

  std::optional<domain::TradeDecision> executeStrategy(
      const std::string& /*user_id*/, const std::string& /*name*/,
      const domain::ResearchResult& /*research*/,
      const domain::Orderbook& /*orderbook*/) override {
    std::function<void()> hook;
    {
      std::lock_guard lock(mutex_);
      ++execute_calls;
      hook = hook_;
    }
    if (hook) {
      hook();
    }
    std::lock_guard lock(mutex_);
    return decision_;
  }

  void decide(std::optional<domain::TradeDecision> decision) {
    std::lock_guard lock(mutex_);
    decision_ = std::move(decision);
  }

  void onExecute(std::function<void()> hook) {
    std::lock_guard lock(mutex_);
    hook_ = std::move(hook);
  }

  int init_calls{0};
  int execute_calls{0};
  StrategyConfig last_config;

 private:
  std::mutex mutex_;
  std::set<std::string> initialized_;
  std::function<void()> hook_;
  std::optional<domain::TradeDecision> decision_;
};

// =============================================================================
// RecordingSink: keeps every broadcast event.
// =============================================================================
class RecordingSink : public IBroadcastSink {
 public:
  void broadcast(const Event& event) override {
    std::lock_guard lock(mutex_);
    events_.push_back(event);
  }

  template <typename T>
  std::vector<T> ofType() const {
    std::lock_guard lock(mutex_);
    std::vector<T> out;
    for (const auto& e : events_) {
      if (const auto* typed = std::get_if<T>(&e)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Event> events_;
};

// Counts stopUserEngine() calls per user.
class CountingLifecycle : public IEngineLifecycle {
 public:
  void stopUserEngine(const std::string& user_id) override {
    std::lock_guard lock(mutex_);
    ++stops_[user_id];
  }

  int stops(const std::string& user_id) const {
    std::lock_guard lock(mutex_);
    auto it = stops_.find(user_id);
    return it == stops_.end() ? 0 : it->second;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, int> stops_;
};

}  // namespace autotrade::test

#include "autotrade/network/zmq_broadcaster.hpp"
#include "autotrade/domain/records.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <type_traits>
#include <utility>

namespace autotrade {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
  if (!value) {
    return nullptr;
  }
  return nlohmann::json(*value);
}

nlohmann::json researchToJson(const ResearchEvent& e) {
  nlohmann::json j;
  j["user_id"] = e.user_id;
  j["symbol"] = e.result.symbol;
  j["signal"] = domain::toString(e.result.signal);
  j["accuracy"] = e.result.accuracy;
  j["recommended_action"] = e.result.recommended_action;
  j["orderbook_imbalance"] = e.result.orderbook_imbalance;
  j["spread_pct"] = e.result.spread_pct;
  j["timestamp_ms"] = e.result.timestamp_ms;
  return j;
}

nlohmann::json executionToJson(const ExecutionEvent& e) {
  const domain::ExecutionLogRecord& r = e.record;
  nlohmann::json j;
  j["user_id"] = e.user_id;
  j["symbol"] = r.symbol;
  j["action"] = domain::toString(r.action);
  j["reason"] = r.reason;
  j["signal"] = r.signal ? nlohmann::json(domain::toString(*r.signal))
                         : nlohmann::json(nullptr);
  j["accuracy"] = optionalToJson(r.accuracy);
  j["min_accuracy_threshold"] = optionalToJson(r.min_accuracy_threshold);
  j["strategy"] = r.strategy;
  j["side"] = r.side ? nlohmann::json(domain::toString(*r.side))
                     : nlohmann::json(nullptr);
  j["quantity"] = optionalToJson(r.quantity);
  j["price"] = optionalToJson(r.price);
  j["order_id"] = optionalToJson(r.order_id);
  j["trade_id"] = optionalToJson(r.trade_id);
  j["position_id"] = optionalToJson(r.position_id);
  j["latency_ms"] = optionalToJson(r.latency_ms);
  j["slippage"] = optionalToJson(r.slippage);
  j["timestamp_ms"] = r.timestamp_ms;
  return j;
}

nlohmann::json riskAlertToJson(const RiskAlertEvent& e) {
  nlohmann::json j;
  j["user_id"] = e.user_id;
  j["symbol"] = e.symbol;
  j["reason"] = e.reason;
  j["timestamp_ms"] = e.timestamp_ms;
  return j;
}

nlohmann::json quoteToJson(const QuoteUpdateEvent& e) {
  nlohmann::json j;
  j["user_id"] = e.user_id;
  j["symbol"] = e.symbol;
  j["kind"] = e.kind == QuoteUpdateEvent::Kind::Placed ? "placed" : "canceled";
  j["bid_order_id"] = optionalToJson(e.bid_order_id);
  j["ask_order_id"] = optionalToJson(e.ask_order_id);
  j["bid_price"] = optionalToJson(e.bid_price);
  j["ask_price"] = optionalToJson(e.ask_price);
  j["mid"] = e.mid;
  j["reason"] = e.reason;
  j["sequence"] = e.sequence;
  j["timestamp_ms"] = e.timestamp_ms;
  return j;
}

}  // namespace

ZmqBroadcaster::ZmqBroadcaster(std::string pub_endpoint)
    : pub_endpoint_(std::move(pub_endpoint)) {}

ZmqBroadcaster::~ZmqBroadcaster() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind PUB socket and spawn worker
// -----------------------------------------------------------------------------
void ZmqBroadcaster::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[ZmqBroadcaster] started. PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal, join, close
// -----------------------------------------------------------------------------
void ZmqBroadcaster::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  pub_socket_.reset();
  context_.reset();

  std::cout << "[ZmqBroadcaster] stopped.\n";
}

void ZmqBroadcaster::broadcast(const Event& event) {
  if (!running_.load()) {
    return;
  }
  queue_.push(event);
}

// -----------------------------------------------------------------------------
// run(): drain loop
// -----------------------------------------------------------------------------
void ZmqBroadcaster::run() {
  while (running_.load()) {
    if (queue_.empty()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(kIdleWaitMs));
      continue;
    }
    publishPending();
  }

  // Final flush before the socket closes.
  publishPending();
}

void ZmqBroadcaster::publishPending() {
  for (const Event& event : queue_.drain()) {
    std::string text;
    try {
      text = formatEvent(event);
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[ZmqBroadcaster] failed to format event: " << e.what()
                << "\n";
      continue;
    }

    zmq::message_t msg(text.data(), text.size());
    try {
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
      std::cerr << "[ZmqBroadcaster] send failed: " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// formatEvent(): {"type": ..., "data": {...}}
// -----------------------------------------------------------------------------
std::string ZmqBroadcaster::formatEvent(const Event& event) {
  nlohmann::json j;
  std::visit(
      [&j](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ResearchEvent>) {
          j["type"] = "research";
          j["data"] = researchToJson(e);
        } else if constexpr (std::is_same_v<T, ExecutionEvent>) {
          j["type"] = "execution";
          j["data"] = executionToJson(e);
        } else if constexpr (std::is_same_v<T, RiskAlertEvent>) {
          j["type"] = "risk:alert";
          j["data"] = riskAlertToJson(e);
        } else if constexpr (std::is_same_v<T, QuoteUpdateEvent>) {
          j["type"] = "quote";
          j["data"] = quoteToJson(e);
        }
      },
      event);
  return j.dump();
}

}  // namespace autotrade

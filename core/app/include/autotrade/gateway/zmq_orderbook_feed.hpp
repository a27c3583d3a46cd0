#pragma once

#include "autotrade/domain/orderbook.hpp"
#include "autotrade/market/i_market_data_source.hpp"
#include "autotrade/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace autotrade {

// -----------------------------------------------------------------------------
// ZmqOrderbookFeed: order book snapshots from a ZeroMQ publisher
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON depth snapshots on a SUB socket, caches the newest
//         one per symbol and pushes it to subscribers.
//
// @details
// Payload format:
//
//   {"symbol": "BTCUSDT", "timestamp_ms": 1700000000000,
//    "bids": [[price, qty], ...], "asks": [[price, qty], ...]}
//
// Levels are re-sorted on arrival (bids descending, asks ascending), so a
// publisher need not guarantee order. Malformed payloads are logged to
// stderr and skipped.
//
// Pull side (IMarketDataSource): getOrderbook() returns the cached snapshot
// truncated to depth, or throws std::runtime_error if none has arrived for
// the symbol. It never blocks on the network.
//
// Push side (IOrderbookFeed): callbacks run on the receive thread while the
// subscription lock is held. They must hand the snapshot over and return;
// calling unsubscribe() from inside a callback deadlocks.
//
// Backtesting: when constructed with a SimulationTimeProvider the clock is
// set to each snapshot's timestamp before subscribers see it.
//
// Thread model:
//   start()/stop() from the owning thread. getOrderbook, subscribeOrderbook
//   and unsubscribe from any thread.
// -----------------------------------------------------------------------------
class ZmqOrderbookFeed final : public IMarketDataSource, public IOrderbookFeed {
 public:
  explicit ZmqOrderbookFeed(std::string endpoint = "tcp://127.0.0.1:5555",
                            SimulationTimeProvider* sim_clock = nullptr);

  // RAII: stop() if still running.
  ~ZmqOrderbookFeed() override;

  ZmqOrderbookFeed(const ZmqOrderbookFeed&) = delete;
  ZmqOrderbookFeed& operator=(const ZmqOrderbookFeed&) = delete;
  ZmqOrderbookFeed(ZmqOrderbookFeed&&) = delete;
  ZmqOrderbookFeed& operator=(ZmqOrderbookFeed&&) = delete;

  // Connects the SUB socket and spawns the receive thread. Idempotent.
  void start();

  // Signals the receive loop and joins it; returns within kRecvTimeoutMs.
  void stop();

  // --- IMarketDataSource ----------------------------------------------------
  domain::Orderbook getOrderbook(const std::string& symbol,
                                 std::size_t depth) override;

  // --- IOrderbookFeed -------------------------------------------------------
  SubscriptionId subscribeOrderbook(const std::string& symbol,
                                    Callback callback) override;
  void unsubscribe(SubscriptionId id) override;

  // -------------------------------------------------------------------------
  // onSnapshot(book)
  // -------------------------------------------------------------------------
  // @brief  Ingests one snapshot: clock, cache, then subscribers.
  //
  // Called by the receive loop for every parsed payload. Public so replay
  // tools can inject snapshots without a socket.
  // -------------------------------------------------------------------------
  void onSnapshot(domain::Orderbook book);

  // -------------------------------------------------------------------------
  // parseSnapshot(payload)
  // -------------------------------------------------------------------------
  // @throws nlohmann::json::exception on malformed JSON, a missing field or
  //         a level that is not a [price, qty] pair.
  // -------------------------------------------------------------------------
  static domain::Orderbook parseSnapshot(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  void run();

  std::string endpoint_;
  SimulationTimeProvider* sim_clock_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;

  mutable std::mutex books_mutex_;
  std::unordered_map<std::string, domain::Orderbook> books_;

  std::mutex subscribers_mutex_;
  SubscriptionId next_subscription_{1};
  std::map<SubscriptionId, std::pair<std::string, Callback>> subscribers_;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace autotrade

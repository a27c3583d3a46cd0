#pragma once

#include "autotrade/concurrent/thread_safe_queue.hpp"
#include "autotrade/events/event.hpp"
#include "autotrade/network/i_broadcast_sink.hpp"

#include <zmq.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace autotrade {

// -----------------------------------------------------------------------------
// ZmqBroadcaster: publishes engine events as JSON on a ZeroMQ PUB socket
// -----------------------------------------------------------------------------
//
// @brief  IBroadcastSink for external observers (dashboards, bots).
//
// @details
// broadcast() only enqueues, so JSON serialization and socket I/O never run
// on an engine's worker thread. A dedicated thread drains the queue and
// sends each event with dontwait: a slow or absent subscriber loses
// messages instead of back-pressuring the engines.
//
// Wire format, one message per event:
//
//   {"type": "research" | "execution" | "risk:alert" | "quote",
//    "data": { ...event fields... }}
//
// Events broadcast while the broadcaster is stopped are dropped.
//
// Thread model:
//   start()/stop() from the owning thread. broadcast() from any thread.
//
// Ownership:
//   Owns the ZMQ context, the PUB socket, the queue and the worker thread.
// -----------------------------------------------------------------------------
class ZmqBroadcaster final : public IBroadcastSink {
 public:
  explicit ZmqBroadcaster(std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: stop() if still running.
  ~ZmqBroadcaster() override;

  ZmqBroadcaster(const ZmqBroadcaster&) = delete;
  ZmqBroadcaster& operator=(const ZmqBroadcaster&) = delete;
  ZmqBroadcaster(ZmqBroadcaster&&) = delete;
  ZmqBroadcaster& operator=(ZmqBroadcaster&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds the PUB socket and spawns the publishing thread.
  //
  // Idempotent. Throws zmq::error_t if the endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Flushes what is queued, joins the thread and closes the socket.
  // Idempotent.
  void stop();

  void broadcast(const Event& event) override;

  // -------------------------------------------------------------------------
  // formatEvent(event)
  // -------------------------------------------------------------------------
  // @brief  The JSON text sent for one event. Pure function.
  // -------------------------------------------------------------------------
  static std::string formatEvent(const Event& event);

  std::size_t queued() const { return queue_.size(); }

 private:
  static constexpr int kIdleWaitMs = 20;

  void run();

  // Sends every queued event. Worker thread only.
  void publishPending();

  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace autotrade

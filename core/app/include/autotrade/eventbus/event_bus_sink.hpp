#pragma once

#include "autotrade/eventbus/event_bus.hpp"
#include "autotrade/network/i_broadcast_sink.hpp"

#include <vector>

namespace autotrade {

// -----------------------------------------------------------------------------
// EventBusSink: IBroadcastSink that publishes onto an in-process EventBus
// -----------------------------------------------------------------------------
// Subscribers run synchronously on the broadcasting engine's thread.
// Holds a non-owning reference; the bus must outlive the sink.
// -----------------------------------------------------------------------------
class EventBusSink final : public IBroadcastSink {
 public:
  explicit EventBusSink(EventBus& bus) : bus_(bus) {}

  void broadcast(const Event& event) override { bus_.publish(event); }

 private:
  EventBus& bus_;
};

// -----------------------------------------------------------------------------
// FanOutSink: forwards every event to several sinks in order
// -----------------------------------------------------------------------------
// A sink that throws is logged by the caller like any other broadcast
// failure; the remaining sinks in the list are skipped for that event.
// -----------------------------------------------------------------------------
class FanOutSink final : public IBroadcastSink {
 public:
  explicit FanOutSink(std::vector<IBroadcastSink*> sinks)
      : sinks_(std::move(sinks)) {}

  void broadcast(const Event& event) override {
    for (IBroadcastSink* sink : sinks_) {
      sink->broadcast(event);
    }
  }

 private:
  std::vector<IBroadcastSink*> sinks_;
};

}  // namespace autotrade

#pragma once

#include "autotrade/events/event.hpp"

namespace autotrade {

// -----------------------------------------------------------------------------
// IBroadcastSink: fire-and-forget delivery of engine events to observers
// -----------------------------------------------------------------------------
//
// @details
// The engines call broadcast() from their worker threads and never depend on
// the outcome. Implementations may still throw; every call site catches
// std::exception, logs it and continues, so a broken observer channel can
// not stop trading.
// -----------------------------------------------------------------------------
class IBroadcastSink {
 public:
  virtual ~IBroadcastSink() = default;

  virtual void broadcast(const Event& event) = 0;
};

}  // namespace autotrade

#pragma once

#include <string>

namespace autotrade {

// -----------------------------------------------------------------------------
// IEngineLifecycle: lets RiskManager stop a user's engines
// -----------------------------------------------------------------------------
//
// @details
// Implemented by UserEngineManager. RiskManager calls it when it pauses a
// user, frequently from inside one of that user's own engine cycles, so the
// implementation must tolerate re-entrant and concurrent calls for the same
// user without joining the calling thread.
// -----------------------------------------------------------------------------
class IEngineLifecycle {
 public:
  virtual ~IEngineLifecycle() = default;

  virtual void stopUserEngine(const std::string& user_id) = 0;
};

}  // namespace autotrade

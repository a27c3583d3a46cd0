#pragma once

#include <string>

namespace autotrade {

// -----------------------------------------------------------------------------
// IAccountProvider: balance and net position lookups for risk checks
// -----------------------------------------------------------------------------
// RiskManager reads both before taking the per-user lock, so implementations
// may do I/O. Both must be safe for concurrent calls.
// -----------------------------------------------------------------------------
class IAccountProvider {
 public:
  virtual ~IAccountProvider() = default;

  virtual double balance(const std::string& user_id) = 0;

  // Signed net quantity: positive long, negative short.
  virtual double position(const std::string& user_id,
                          const std::string& symbol) = 0;
};

}  // namespace autotrade

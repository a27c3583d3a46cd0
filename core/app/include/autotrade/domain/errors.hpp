#pragma once

#include <stdexcept>
#include <string>

namespace autotrade {

// -----------------------------------------------------------------------------
// ConfigurationError
// -----------------------------------------------------------------------------
// Caller-side contract violation: an engine started without a user, a user
// with no stored settings asked to trade, an invalid config value. Never used
// for business denials, which are returned as values.
// -----------------------------------------------------------------------------
class ConfigurationError : public std::logic_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::logic_error(what) {}
};

// -----------------------------------------------------------------------------
// StrategyAlreadyInitializedError
// -----------------------------------------------------------------------------
// Thrown by IStrategyRunner::initializeStrategy() for a (user, strategy) pair
// that is already initialized. The orchestrator initializes on every execute
// path and swallows exactly this error.
// -----------------------------------------------------------------------------
class StrategyAlreadyInitializedError : public std::runtime_error {
 public:
  explicit StrategyAlreadyInitializedError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace autotrade

#pragma once

#include "autotrade/domain/order.hpp"
#include "autotrade/domain/position.hpp"

#include <optional>
#include <string>
#include <vector>

namespace autotrade {

// -----------------------------------------------------------------------------
// IOrderGateway: order placement and cancellation for one venue account
// -----------------------------------------------------------------------------
//
// @brief  The only way the engines touch the market.
//
// @details
// placeOrder() returns the acknowledged order, or std::nullopt when the
// venue declined to create one (no exception, nothing to cancel). Transport
// failures are thrown as std::runtime_error. cancelOrder() on an order that
// is already terminal is a no-op, not an error: quote timers and engine
// shutdown both race against fills.
//
// Thread model: Implementations must accept concurrent calls from every
// user's engine threads and from QuoteEngine timer threads.
// -----------------------------------------------------------------------------
class IOrderGateway {
 public:
  virtual ~IOrderGateway() = default;

  virtual std::optional<domain::Order> placeOrder(
      const std::string& user_id, const domain::OrderRequest& request) = 0;

  virtual void cancelOrder(const domain::OrderId& order_id) = 0;
};

// -----------------------------------------------------------------------------
// IPositionManager: optional exit-monitor capability
// -----------------------------------------------------------------------------
//
// @brief  Enumerates and closes positions that carry exit parameters.
//
// @details
// A gateway opts in by also implementing this interface. The composition
// root passes it to ExecutionOrchestrator as a nullable pointer; with null
// the exit monitor is skipped without any error.
// -----------------------------------------------------------------------------
class IPositionManager {
 public:
  virtual ~IPositionManager() = default;

  virtual std::vector<domain::OpenPosition> getOpenPositions(
      const std::string& user_id, const std::string& symbol) = 0;

  virtual void closePosition(const std::string& user_id,
                             const std::string& symbol,
                             const std::string& position_id) = 0;
};

}  // namespace autotrade

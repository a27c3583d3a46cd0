#pragma once

#include "autotrade/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace autotrade {
namespace domain {

// Venue order identifier. Strings, because real venues hand back opaque ids.
using OrderId = std::string;

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,
  Limit,
};

inline Side opposite(Side s) { return s == Side::Buy ? Side::Sell : Side::Buy; }

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// Responsibility: What a caller asks the order collaborator to do. The
// optional exit parameters travel with entry orders placed by the
// orchestrator so the collaborator can open a tracked position that the
// exit monitor later evaluates.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Limit};
  double quantity{0.0};
  double price{0.0};
  std::optional<double> stop_loss;
  std::optional<double> take_profit;
  std::optional<std::int64_t> ttl_ms;
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Responsibility: Snapshot of an order as acknowledged by the venue.
// avg_price is present once any quantity has filled.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id;
  std::string symbol;
  Side side{Side::Buy};
  OrderType type{OrderType::Limit};
  double quantity{0.0};
  double price{0.0};
  std::optional<double> avg_price;
  double filled_quantity{0.0};
  OrderStatus status{OrderStatus::New};
};

}  // namespace domain
}  // namespace autotrade

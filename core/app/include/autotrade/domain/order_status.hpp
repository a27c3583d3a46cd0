#pragma once

namespace autotrade {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: venue-reported order state
// -----------------------------------------------------------------------------
//
// @brief  State of an order as reported back by the order collaborator.
//
// @details
//   Accepted ──> PartiallyFilled ──> Filled
//      │                │
//      └──> Canceled <──┘
//   Rejected / Expired are terminal and never follow a fill.
//
// The orchestrator only needs to know that an order came back; QuoteEngine
// treats a quote order as live until it cancels it. PaperOrderGateway uses
// the full set.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  New,
  Accepted,
  PartiallyFilled,
  Filled,
  Canceled,
  Rejected,
  Expired,
};

inline bool isTerminal(OrderStatus s) {
  return s == OrderStatus::Filled || s == OrderStatus::Canceled ||
         s == OrderStatus::Rejected || s == OrderStatus::Expired;
}

}  // namespace domain
}  // namespace autotrade

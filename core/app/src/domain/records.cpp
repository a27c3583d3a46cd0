#include "autotrade/domain/records.hpp"

namespace autotrade {
namespace domain {

// Wire names. These strings are part of the broadcast payloads and the
// persisted execution logs, so they are upper-case like the venue side.

const char* toString(ExecutionAction a) {
  switch (a) {
    case ExecutionAction::Executed: return "EXECUTED";
    case ExecutionAction::Skipped:  return "SKIPPED";
    case ExecutionAction::Closed:   return "CLOSED";
  }
  return "UNKNOWN";
}

const char* toString(Signal s) {
  switch (s) {
    case Signal::Buy:  return "BUY";
    case Signal::Sell: return "SELL";
    case Signal::Hold: return "HOLD";
  }
  return "UNKNOWN";
}

const char* toString(TradeAction a) {
  switch (a) {
    case TradeAction::Buy:  return "BUY";
    case TradeAction::Sell: return "SELL";
    case TradeAction::Hold: return "HOLD";
  }
  return "UNKNOWN";
}

const char* toString(Side s) {
  switch (s) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

const char* toString(OrderType t) {
  switch (t) {
    case OrderType::Market: return "MARKET";
    case OrderType::Limit:  return "LIMIT";
  }
  return "UNKNOWN";
}

const char* toString(OrderStatus s) {
  switch (s) {
    case OrderStatus::New:             return "NEW";
    case OrderStatus::Accepted:        return "ACCEPTED";
    case OrderStatus::PartiallyFilled: return "PARTIALLY_FILLED";
    case OrderStatus::Filled:          return "FILLED";
    case OrderStatus::Canceled:        return "CANCELED";
    case OrderStatus::Rejected:        return "REJECTED";
    case OrderStatus::Expired:         return "EXPIRED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace autotrade

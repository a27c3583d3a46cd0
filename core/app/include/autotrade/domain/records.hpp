#pragma once

#include "autotrade/domain/order.hpp"
#include "autotrade/domain/research.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace autotrade {
namespace domain {

// -----------------------------------------------------------------------------
// TradeRecord: one executed trade, as persisted
// -----------------------------------------------------------------------------
struct TradeRecord {
  std::string id;  // assigned by IRecordStore::saveTrade()
  std::string user_id;
  std::string symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  OrderId order_id;
  std::string strategy;
  std::string engine_type{"auto"};
  std::int64_t timestamp_ms{0};
};

enum class ExecutionAction {
  Executed,
  Skipped,
  Closed,
};

// -----------------------------------------------------------------------------
// ExecutionLogRecord: one decision of the execution orchestrator
// -----------------------------------------------------------------------------
//
// @details
// Every cycle produces exactly one of these (plus one Closed record per exit
// the monitor performs), so the decision trail can be reconstructed from the
// store alone. Execution-only fields are unset on Skipped records.
// -----------------------------------------------------------------------------
struct ExecutionLogRecord {
  std::string user_id;
  std::string symbol;
  ExecutionAction action{ExecutionAction::Skipped};
  std::string reason;
  std::optional<Signal> signal;
  std::optional<double> accuracy;
  std::optional<double> min_accuracy_threshold;
  std::string strategy;
  std::optional<Side> side;
  std::optional<double> quantity;
  std::optional<double> price;
  std::optional<OrderId> order_id;
  std::optional<std::string> trade_id;
  std::optional<std::string> position_id;
  std::optional<std::int64_t> latency_ms;
  std::optional<double> slippage;
  std::int64_t timestamp_ms{0};
};

// Per-user counters kept by the record store.
struct UserStats {
  std::string user_id;
  std::uint64_t total_trades{0};
  std::int64_t last_trade_ms{0};
};

struct GlobalStats {
  std::uint64_t total_trades{0};
};

const char* toString(ExecutionAction a);
const char* toString(Signal s);
const char* toString(TradeAction a);
const char* toString(Side s);
const char* toString(OrderType t);
const char* toString(OrderStatus s);

}  // namespace domain
}  // namespace autotrade

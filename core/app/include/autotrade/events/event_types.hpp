#pragma once

#include "autotrade/domain/order.hpp"
#include "autotrade/domain/records.hpp"
#include "autotrade/domain/research.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace autotrade {

// -----------------------------------------------------------------------------
// Broadcast event payloads
// -----------------------------------------------------------------------------
// All events are plain value types with no references into engine state, so
// they can be queued and handed across threads by copy. Every event carries
// the user it concerns; observers filter on it.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// ResearchEvent: published by ExecutionOrchestrator at the start of every
// cycle, whatever the gate later decides.
// -----------------------------------------------------------------------------
struct ResearchEvent {
  std::string user_id;
  domain::ResearchResult result;
};

// -----------------------------------------------------------------------------
// ExecutionEvent: one execution log record (EXECUTED, SKIPPED or CLOSED).
// -----------------------------------------------------------------------------
struct ExecutionEvent {
  std::string user_id;
  domain::ExecutionLogRecord record;
};

// -----------------------------------------------------------------------------
// RiskAlertEvent: a trade was denied by RiskManager on the execute path.
// -----------------------------------------------------------------------------
struct RiskAlertEvent {
  std::string user_id;
  std::string symbol;
  std::string reason;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// QuoteUpdateEvent: QuoteEngine placed a two-sided quote or pulled one.
// -----------------------------------------------------------------------------
struct QuoteUpdateEvent {
  enum class Kind {
    Placed,
    Canceled,
  };

  std::string user_id;
  std::string symbol;
  Kind kind{Kind::Placed};
  std::optional<domain::OrderId> bid_order_id;
  std::optional<domain::OrderId> ask_order_id;
  std::optional<double> bid_price;
  std::optional<double> ask_price;
  double mid{0.0};
  std::string reason;
  std::uint64_t sequence{0};
  std::int64_t timestamp_ms{0};
};

}  // namespace autotrade

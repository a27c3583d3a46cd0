#pragma once

#include "autotrade/events/event_types.hpp"

#include <variant>

namespace autotrade {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope for everything the engines broadcast.
// One variant lets the EventBus, the broadcast queue and the JSON formatter
// handle every kind by value; std::get_if / std::visit dispatch on it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    ResearchEvent,
    ExecutionEvent,
    RiskAlertEvent,
    QuoteUpdateEvent>;

}  // namespace autotrade

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace autotrade {

// -----------------------------------------------------------------------------
// IMetricsSink: per-user, per-strategy trade counters
// -----------------------------------------------------------------------------
// Fire-and-forget. Implementations must not throw and must be safe for
// concurrent calls.
// -----------------------------------------------------------------------------
class IMetricsSink {
 public:
  virtual ~IMetricsSink() = default;

  virtual void recordTrade(const std::string& user_id,
                           const std::string& strategy, bool success,
                           std::optional<std::int64_t> latency_ms) = 0;

  virtual void recordCancel(const std::string& user_id,
                            const std::string& strategy) = 0;
};

}  // namespace autotrade

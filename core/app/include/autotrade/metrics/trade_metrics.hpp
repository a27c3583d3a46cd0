#pragma once

#include "autotrade/metrics/i_metrics_sink.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace autotrade {

// -----------------------------------------------------------------------------
// TradeMetrics: in-process IMetricsSink
// -----------------------------------------------------------------------------
//
// @brief  Counters per (user, strategy): executed and failed trades, quote
//         cancels, and latency sum/count for an average.
//
// Thread model: One mutex; snapshot() returns a copy.
// -----------------------------------------------------------------------------
class TradeMetrics final : public IMetricsSink {
 public:
  struct Counters {
    std::uint64_t trades_executed{0};
    std::uint64_t failed_orders{0};
    std::uint64_t cancels{0};
    std::int64_t latency_sum_ms{0};
    std::uint64_t latency_samples{0};

    double averageLatencyMs() const {
      return latency_samples == 0
                 ? 0.0
                 : static_cast<double>(latency_sum_ms) /
                       static_cast<double>(latency_samples);
    }
  };

  void recordTrade(const std::string& user_id, const std::string& strategy,
                   bool success,
                   std::optional<std::int64_t> latency_ms) override;

  void recordCancel(const std::string& user_id,
                    const std::string& strategy) override;

  // Zeroed counters for an unknown pair.
  Counters snapshot(const std::string& user_id,
                    const std::string& strategy) const;

 private:
  using Key = std::pair<std::string, std::string>;

  mutable std::mutex mutex_;
  std::map<Key, Counters> counters_;
};

}  // namespace autotrade

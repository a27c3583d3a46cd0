#include "autotrade/metrics/trade_metrics.hpp"

namespace autotrade {

void TradeMetrics::recordTrade(const std::string& user_id,
                               const std::string& strategy, bool success,
                               std::optional<std::int64_t> latency_ms) {
  std::lock_guard lock(mutex_);
  Counters& c = counters_[Key{user_id, strategy}];
  if (success) {
    ++c.trades_executed;
  } else {
    ++c.failed_orders;
  }
  if (latency_ms) {
    c.latency_sum_ms += *latency_ms;
    ++c.latency_samples;
  }
}

void TradeMetrics::recordCancel(const std::string& user_id,
                                const std::string& strategy) {
  std::lock_guard lock(mutex_);
  ++counters_[Key{user_id, strategy}].cancels;
}

TradeMetrics::Counters TradeMetrics::snapshot(
    const std::string& user_id, const std::string& strategy) const {
  std::lock_guard lock(mutex_);
  auto it = counters_.find(Key{user_id, strategy});
  return it == counters_.end() ? Counters{} : it->second;
}

}  // namespace autotrade

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace autotrade {

// -----------------------------------------------------------------------------
// OrderIdGenerator
// -----------------------------------------------------------------------------
//
// @brief  Thread-safe source of venue-style order and position identifiers.
//
// @details
// Produces "<prefix>-<n>" strings with n starting at 1. The counter is a
// relaxed atomic: uniqueness is all that is required, not ordering between
// threads. PaperOrderGateway owns one for orders and one for positions.
//
// Thread-safety: next_id() may be called concurrently from any thread.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  explicit OrderIdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::string next_id() {
    const std::uint64_t n = next_.fetch_add(1, std::memory_order_relaxed);
    return prefix_ + "-" + std::to_string(n);
  }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace autotrade

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace autotrade {
namespace domain {

struct PriceLevel {
  double price{0.0};
  double quantity{0.0};
};

// -----------------------------------------------------------------------------
// Orderbook: depth snapshot for one symbol
// -----------------------------------------------------------------------------
//
// @brief  Bids sorted best (highest) first, asks sorted best (lowest) first.
//
// @details
// Producers (ZmqOrderbookFeed, test doubles) are responsible for the sort
// order; consumers only read levels [0..depth). A book with an empty side is
// valid data but unusable for pricing: mid() and spread() return nullopt.
// -----------------------------------------------------------------------------
struct Orderbook {
  std::string symbol;
  std::vector<PriceLevel> bids;
  std::vector<PriceLevel> asks;
  std::int64_t timestamp_ms{0};

  bool hasBothSides() const { return !bids.empty() && !asks.empty(); }

  std::optional<double> bestBid() const {
    if (bids.empty()) return std::nullopt;
    return bids.front().price;
  }

  std::optional<double> bestAsk() const {
    if (asks.empty()) return std::nullopt;
    return asks.front().price;
  }

  std::optional<double> mid() const {
    if (!hasBothSides()) return std::nullopt;
    return (bids.front().price + asks.front().price) / 2.0;
  }

  // Best ask minus best bid. Zero or negative means locked or crossed.
  std::optional<double> spread() const {
    if (!hasBothSides()) return std::nullopt;
    return asks.front().price - bids.front().price;
  }
};

}  // namespace domain
}  // namespace autotrade

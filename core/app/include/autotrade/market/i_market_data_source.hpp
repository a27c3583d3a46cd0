#pragma once

#include "autotrade/domain/orderbook.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace autotrade {

// -----------------------------------------------------------------------------
// IMarketDataSource: pull access to order book snapshots
// -----------------------------------------------------------------------------
//
// @brief  Returns the current depth snapshot for a symbol.
//
// @details
// Called from engine worker threads at every cycle. Implementations must
// bound the call (no indefinite blocking) and signal failure by throwing
// std::runtime_error; the calling cycle treats that as a transient I/O
// failure and backs off.
//
// Thread model: Must be safe for concurrent calls from several users' loops.
// -----------------------------------------------------------------------------
class IMarketDataSource {
 public:
  virtual ~IMarketDataSource() = default;

  virtual domain::Orderbook getOrderbook(const std::string& symbol,
                                         std::size_t depth) = 0;
};

// -----------------------------------------------------------------------------
// IOrderbookFeed: optional push capability
// -----------------------------------------------------------------------------
//
// @brief  Delivers snapshots to a callback as they arrive.
//
// @details
// Not every source can push. QuoteEngine takes an `IOrderbookFeed*` next to
// its IMarketDataSource; when non-null it subscribes and drains the newest
// pushed snapshot each cycle, and pulls otherwise. Callbacks run on the
// feed's thread and must only hand the snapshot over, not act on it.
// -----------------------------------------------------------------------------
class IOrderbookFeed {
 public:
  using SubscriptionId = std::uint64_t;
  using Callback = std::function<void(const domain::Orderbook&)>;

  virtual ~IOrderbookFeed() = default;

  virtual SubscriptionId subscribeOrderbook(const std::string& symbol,
                                            Callback callback) = 0;

  // After return the callback is not invoked again.
  virtual void unsubscribe(SubscriptionId id) = 0;
};

}  // namespace autotrade

#pragma once

#include "autotrade/concurrent/order_id_generator.hpp"
#include "autotrade/domain/orderbook.hpp"
#include "autotrade/domain/position.hpp"
#include "autotrade/execution/i_order_gateway.hpp"
#include "autotrade/risk/i_account_provider.hpp"
#include "autotrade/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace autotrade {

// -----------------------------------------------------------------------------
// PaperOrderGateway: simulated venue account
// -----------------------------------------------------------------------------
//
// @brief  IOrderGateway + IPositionManager + IAccountProvider backed by an
//         in-memory book of orders, net positions and exit-tracked entries.
//
// @details
// Fill model:
//   - Market orders fill immediately and completely at the request price
//     (the caller passes the touch it decided on).
//   - Limit orders rest with status Accepted until onOrderbook() sees the
//     opposite touch cross them (best ask ≤ buy price, best bid ≥ sell
//     price). They then fill completely at their own limit price.
//   - cancelOrder() on a resting order cancels it; on anything else it is a
//     no-op.
//
// Only resting limit orders are indexed (per symbol), so onOrderbook()
// touches nothing but the orders that can still fill. Orders leaving that
// index (filled, canceled) move to a history of the last history_capacity
// terminal orders, which backs order() lookups.
//
// Position math (applyFill) per fill of signed quantity q at price p:
//   Case 1, same direction: weighted average entry, realized PnL unchanged.
//   Case 2, reducing: realized += closed × (p − avg) × dir; avg unchanged.
//   Case 3, reversal: close the whole position as in Case 2, open the rest
//            at p.
//
// balance(user) = starting_balance + Σ realized PnL over the user's symbols.
//
// A filled market order carrying stop_loss, take_profit or ttl_ms also
// opens an OpenPosition for the exit monitor. closePosition() flattens it
// with an opposite fill at the last mid seen by onOrderbook() (entry price
// when no book has been seen).
//
// Thread model:
//   All state is behind one std::shared_mutex: writers (place, cancel, book
//   updates, close) take it exclusively, read accessors take it shared.
//   Nothing calls out while holding it.
// -----------------------------------------------------------------------------
class PaperOrderGateway final : public IOrderGateway,
                                public IPositionManager,
                                public IAccountProvider {
 public:
  explicit PaperOrderGateway(const ITimeProvider& clock,
                             double starting_balance = 10000.0,
                             std::size_t history_capacity = 1024);

  PaperOrderGateway(const PaperOrderGateway&) = delete;
  PaperOrderGateway& operator=(const PaperOrderGateway&) = delete;
  PaperOrderGateway(PaperOrderGateway&&) = delete;
  PaperOrderGateway& operator=(PaperOrderGateway&&) = delete;

  // --- IOrderGateway --------------------------------------------------------

  // -------------------------------------------------------------------------
  // placeOrder(user_id, request)
  // -------------------------------------------------------------------------
  // @return The order snapshot after placement (Filled for market, Accepted
  //         for limit), or std::nullopt when the request is rejected
  //         (non-positive quantity or price).
  // -------------------------------------------------------------------------
  std::optional<domain::Order> placeOrder(
      const std::string& user_id, const domain::OrderRequest& request) override;

  void cancelOrder(const domain::OrderId& order_id) override;

  // --- IPositionManager -----------------------------------------------------
  std::vector<domain::OpenPosition> getOpenPositions(
      const std::string& user_id, const std::string& symbol) override;

  // @throws std::invalid_argument for an unknown position id.
  void closePosition(const std::string& user_id, const std::string& symbol,
                     const std::string& position_id) override;

  // --- IAccountProvider -----------------------------------------------------
  double balance(const std::string& user_id) override;
  double position(const std::string& user_id,
                  const std::string& symbol) override;

  // -------------------------------------------------------------------------
  // onOrderbook(book)
  // -------------------------------------------------------------------------
  // @brief  Matches resting limit orders for book.symbol and remembers the
  //         mid for closePosition(). Wired to the order book feed.
  // -------------------------------------------------------------------------
  void onOrderbook(const domain::Orderbook& book);

  // --- Inspection -----------------------------------------------------------
  // Resting orders, then the terminal-order history; nullopt once evicted.
  std::optional<domain::Order> order(const domain::OrderId& order_id) const;
  std::size_t restingOrderCount() const;
  std::size_t historySize() const;
  std::optional<domain::Position> netPosition(const std::string& user_id,
                                              const std::string& symbol) const;

  // Applies one signed fill to a net position (see class comment).
  static void applyFill(domain::Position& pos, double signed_fill_qty,
                        double fill_price);

 private:
  struct OrderEntry {
    std::string user_id;
    domain::Order order;
  };

  // Both require mutex_ held exclusively.
  void fillLocked(OrderEntry& entry, double fill_price);
  void retireLocked(const domain::Order& order);

  const ITimeProvider& clock_;
  const double starting_balance_;
  const std::size_t history_capacity_;

  OrderIdGenerator order_ids_{"paper"};
  OrderIdGenerator position_ids_{"pos"};

  mutable std::shared_mutex mutex_;
  // symbol -> resting limit orders
  std::unordered_map<std::string,
                     std::unordered_map<domain::OrderId, OrderEntry>>
      resting_;
  std::unordered_map<domain::OrderId, std::string> resting_symbol_;
  // Terminal orders, oldest first in history_order_.
  std::unordered_map<domain::OrderId, domain::Order> history_;
  std::deque<domain::OrderId> history_order_;
  // user -> symbol -> net position
  std::unordered_map<std::string,
                     std::unordered_map<std::string, domain::Position>>
      positions_;
  // user -> exit-tracked entries
  std::unordered_map<std::string, std::vector<domain::OpenPosition>>
      open_positions_;
  std::unordered_map<std::string, double> last_mid_;
};

}  // namespace autotrade

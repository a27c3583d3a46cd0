#include "autotrade/execution/paper_order_gateway.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace autotrade {

PaperOrderGateway::PaperOrderGateway(const ITimeProvider& clock,
                                     double starting_balance,
                                     std::size_t history_capacity)
    : clock_(clock),
      starting_balance_(starting_balance),
      history_capacity_(history_capacity) {}

// -----------------------------------------------------------------------------
// placeOrder
// -----------------------------------------------------------------------------
std::optional<domain::Order> PaperOrderGateway::placeOrder(
    const std::string& user_id, const domain::OrderRequest& request) {
  if (request.quantity <= 0.0 || request.price <= 0.0) {
    std::cerr << "[PaperOrderGateway] rejected order user=" << user_id
              << " symbol=" << request.symbol << " qty=" << request.quantity
              << " price=" << request.price << "\n";
    return std::nullopt;
  }

  OrderEntry entry;
  entry.user_id = user_id;
  entry.order.id = order_ids_.next_id();
  entry.order.symbol = request.symbol;
  entry.order.side = request.side;
  entry.order.type = request.type;
  entry.order.quantity = request.quantity;
  entry.order.price = request.price;
  entry.order.status = domain::OrderStatus::Accepted;

  std::unique_lock lock(mutex_);

  if (request.type == domain::OrderType::Limit) {
    const domain::Order placed = entry.order;
    resting_symbol_[placed.id] = placed.symbol;
    resting_[placed.symbol].emplace(placed.id, std::move(entry));
    return placed;
  }

  fillLocked(entry, request.price);
  retireLocked(entry.order);

  if (request.stop_loss || request.take_profit || request.ttl_ms) {
    domain::OpenPosition pos;
    pos.id = position_ids_.next_id();
    pos.symbol = request.symbol;
    pos.side = request.side;
    pos.quantity = request.quantity;
    pos.entry_price = request.price;
    pos.stop_loss = request.stop_loss;
    pos.take_profit = request.take_profit;
    pos.opened_at_ms = clock_.now_ms();
    pos.ttl_ms = request.ttl_ms;
    open_positions_[user_id].push_back(std::move(pos));
  }

  return entry.order;
}

// -----------------------------------------------------------------------------
// cancelOrder: only resting orders can be canceled
// -----------------------------------------------------------------------------
void PaperOrderGateway::cancelOrder(const domain::OrderId& order_id) {
  std::unique_lock lock(mutex_);
  auto symbol_it = resting_symbol_.find(order_id);
  if (symbol_it == resting_symbol_.end()) {
    return;
  }
  auto& book = resting_[symbol_it->second];
  auto it = book.find(order_id);
  it->second.order.status = domain::OrderStatus::Canceled;
  retireLocked(it->second.order);
  book.erase(it);
  resting_symbol_.erase(symbol_it);
}

// -----------------------------------------------------------------------------
// onOrderbook: match resting limit orders against the new touch
// -----------------------------------------------------------------------------
void PaperOrderGateway::onOrderbook(const domain::Orderbook& book) {
  std::unique_lock lock(mutex_);

  if (auto mid = book.mid()) {
    last_mid_[book.symbol] = *mid;
  }

  const auto best_bid = book.bestBid();
  const auto best_ask = book.bestAsk();

  auto book_it = resting_.find(book.symbol);
  if (book_it == resting_.end()) {
    return;
  }
  auto& orders = book_it->second;
  for (auto it = orders.begin(); it != orders.end();) {
    const domain::Order& order = it->second.order;
    const bool crossed =
        order.side == domain::Side::Buy
            ? (best_ask && *best_ask <= order.price)
            : (best_bid && *best_bid >= order.price);
    if (!crossed) {
      ++it;
      continue;
    }
    fillLocked(it->second, order.price);
    retireLocked(it->second.order);
    resting_symbol_.erase(it->first);
    it = orders.erase(it);
  }
}

// -----------------------------------------------------------------------------
// fillLocked: complete fill, position update
// -----------------------------------------------------------------------------
void PaperOrderGateway::fillLocked(OrderEntry& entry, double fill_price) {
  domain::Order& order = entry.order;
  order.filled_quantity = order.quantity;
  order.avg_price = fill_price;
  order.status = domain::OrderStatus::Filled;

  domain::Position& pos = positions_[entry.user_id][order.symbol];
  if (pos.symbol.empty()) {
    pos.symbol = order.symbol;
  }
  const double signed_qty =
      order.side == domain::Side::Buy ? order.quantity : -order.quantity;
  applyFill(pos, signed_qty, fill_price);
}

// -----------------------------------------------------------------------------
// retireLocked: keep the last history_capacity_ terminal orders
// -----------------------------------------------------------------------------
void PaperOrderGateway::retireLocked(const domain::Order& order) {
  if (history_capacity_ == 0) {
    return;
  }
  history_[order.id] = order;
  history_order_.push_back(order.id);
  while (history_order_.size() > history_capacity_) {
    history_.erase(history_order_.front());
    history_order_.pop_front();
  }
}

// -----------------------------------------------------------------------------
// applyFill: net position and realized PnL math
// -----------------------------------------------------------------------------
void PaperOrderGateway::applyFill(domain::Position& pos,
                                  double signed_fill_qty, double fill_price) {
  const double current_qty = pos.net_quantity;

  if (current_qty == 0.0) {
    pos.net_quantity = signed_fill_qty;
    pos.average_price = fill_price;
    return;
  }

  const bool same_direction = (current_qty > 0.0) == (signed_fill_qty > 0.0);
  if (same_direction) {
    const double new_total = current_qty + signed_fill_qty;
    pos.average_price =
        (current_qty * pos.average_price + signed_fill_qty * fill_price) /
        new_total;
    pos.net_quantity = new_total;
    return;
  }

  const double abs_current = std::abs(current_qty);
  const double abs_fill = std::abs(signed_fill_qty);
  const double direction_sign = current_qty > 0.0 ? 1.0 : -1.0;

  if (abs_fill <= abs_current) {
    pos.realized_pnl +=
        abs_fill * (fill_price - pos.average_price) * direction_sign;
    pos.net_quantity = current_qty + signed_fill_qty;
    if (pos.net_quantity == 0.0) {
      pos.average_price = 0.0;
    }
    return;
  }

  // Reversal: flatten, then open the remainder at the fill price.
  pos.realized_pnl +=
      abs_current * (fill_price - pos.average_price) * direction_sign;
  const double new_direction_sign = signed_fill_qty > 0.0 ? 1.0 : -1.0;
  pos.net_quantity = new_direction_sign * (abs_fill - abs_current);
  pos.average_price = fill_price;
}

// -----------------------------------------------------------------------------
// IPositionManager
// -----------------------------------------------------------------------------
std::vector<domain::OpenPosition> PaperOrderGateway::getOpenPositions(
    const std::string& user_id, const std::string& symbol) {
  std::shared_lock lock(mutex_);
  std::vector<domain::OpenPosition> result;
  auto it = open_positions_.find(user_id);
  if (it == open_positions_.end()) {
    return result;
  }
  for (const auto& pos : it->second) {
    if (pos.symbol == symbol) {
      result.push_back(pos);
    }
  }
  return result;
}

void PaperOrderGateway::closePosition(const std::string& user_id,
                                      const std::string& symbol,
                                      const std::string& position_id) {
  std::unique_lock lock(mutex_);
  auto& entries = open_positions_[user_id];
  auto it = std::find_if(entries.begin(), entries.end(),
                         [&](const domain::OpenPosition& p) {
                           return p.id == position_id && p.symbol == symbol;
                         });
  if (it == entries.end()) {
    throw std::invalid_argument("Unknown position " + position_id);
  }

  auto mid_it = last_mid_.find(symbol);
  const double exit_price =
      mid_it != last_mid_.end() ? mid_it->second : it->entry_price;

  OrderEntry exit;
  exit.user_id = user_id;
  exit.order.id = order_ids_.next_id();
  exit.order.symbol = symbol;
  exit.order.side = domain::opposite(it->side);
  exit.order.type = domain::OrderType::Market;
  exit.order.quantity = it->quantity;
  exit.order.price = exit_price;
  fillLocked(exit, exit_price);
  retireLocked(exit.order);

  entries.erase(it);
}

// -----------------------------------------------------------------------------
// IAccountProvider
// -----------------------------------------------------------------------------
double PaperOrderGateway::balance(const std::string& user_id) {
  std::shared_lock lock(mutex_);
  double realized = 0.0;
  auto it = positions_.find(user_id);
  if (it != positions_.end()) {
    for (const auto& [symbol, pos] : it->second) {
      realized += pos.realized_pnl;
    }
  }
  return starting_balance_ + realized;
}

double PaperOrderGateway::position(const std::string& user_id,
                                   const std::string& symbol) {
  auto pos = netPosition(user_id, symbol);
  return pos ? pos->net_quantity : 0.0;
}

// -----------------------------------------------------------------------------
// Inspection
// -----------------------------------------------------------------------------
std::optional<domain::Order> PaperOrderGateway::order(
    const domain::OrderId& order_id) const {
  std::shared_lock lock(mutex_);
  auto symbol_it = resting_symbol_.find(order_id);
  if (symbol_it != resting_symbol_.end()) {
    return resting_.at(symbol_it->second).at(order_id).order;
  }
  auto it = history_.find(order_id);
  if (it == history_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t PaperOrderGateway::restingOrderCount() const {
  std::shared_lock lock(mutex_);
  return resting_symbol_.size();
}

std::size_t PaperOrderGateway::historySize() const {
  std::shared_lock lock(mutex_);
  return history_.size();
}

std::optional<domain::Position> PaperOrderGateway::netPosition(
    const std::string& user_id, const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto user_it = positions_.find(user_id);
  if (user_it == positions_.end()) {
    return std::nullopt;
  }
  auto it = user_it->second.find(symbol);
  if (it == user_it->second.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace autotrade

#include "autotrade/research/orderbook_imbalance_research.hpp"
#include "autotrade/domain/records.hpp"

#include <algorithm>
#include <cmath>

namespace autotrade {

namespace {

double topNotional(const std::vector<domain::PriceLevel>& levels,
                   std::size_t n) {
  double sum = 0.0;
  for (std::size_t i = 0; i < std::min(n, levels.size()); ++i) {
    sum += levels[i].price * levels[i].quantity;
  }
  return sum;
}

double topQuantity(const std::vector<domain::PriceLevel>& levels,
                   std::size_t n) {
  double sum = 0.0;
  for (std::size_t i = 0; i < std::min(n, levels.size()); ++i) {
    sum += levels[i].quantity;
  }
  return sum;
}

}  // namespace

OrderbookImbalanceResearch::OrderbookImbalanceResearch(
    const ITimeProvider& clock, Options options)
    : clock_(clock), options_(options) {}

domain::ResearchResult OrderbookImbalanceResearch::runResearch(
    const std::string& symbol, const std::string& /*user_id*/,
    IMarketDataSource& market) {
  domain::Orderbook book = market.getOrderbook(symbol, options_.depth);
  if (book.symbol.empty()) {
    book.symbol = symbol;
  }
  return analyze(book);
}

double OrderbookImbalanceResearch::imbalance(const domain::Orderbook& book,
                                             std::size_t levels) {
  if (!book.hasBothSides()) {
    return 0.0;
  }
  const double bid_qty = topQuantity(book.bids, levels);
  const double ask_qty = topQuantity(book.asks, levels);
  const double total = bid_qty + ask_qty;
  if (total == 0.0) {
    return 0.0;
  }
  // Positive means more resting bids.
  return (bid_qty - ask_qty) / total;
}

// -----------------------------------------------------------------------------
// analyze: tiers documented in the header
// -----------------------------------------------------------------------------
domain::ResearchResult OrderbookImbalanceResearch::analyze(
    const domain::Orderbook& book) const {
  domain::ResearchResult result;
  result.symbol = book.symbol;
  result.timestamp_ms = clock_.now_ms();
  result.orderbook_imbalance = imbalance(book, options_.imbalance_levels);

  const auto mid = book.mid();
  const auto spread = book.spread();
  result.spread_pct =
      (mid && *mid > 0.0 && spread) ? (*spread / *mid) * 100.0 : 0.0;

  const double strength = std::abs(result.orderbook_imbalance);
  const double notional = topNotional(book.bids, 5) + topNotional(book.asks, 5);

  double accuracy = 0.5;

  if (strength > 0.3) {
    accuracy += 0.15;
  } else if (strength > 0.15) {
    accuracy += 0.1;
  } else if (strength > 0.05) {
    accuracy += 0.05;
  }

  if (book.hasBothSides()) {
    if (result.spread_pct < 0.05) {
      accuracy += 0.15;
    } else if (result.spread_pct < 0.1) {
      accuracy += 0.1;
    } else if (result.spread_pct < 0.2) {
      accuracy += 0.05;
    }
  }

  if (notional > 500000.0) {
    accuracy += 0.15;
  } else if (notional > 100000.0) {
    accuracy += 0.1;
  } else if (notional > 50000.0) {
    accuracy += 0.05;
  }

  if (notional > 1000000.0) {
    accuracy += 0.1;
  } else if (notional > 500000.0) {
    accuracy += 0.05;
  }

  result.accuracy = std::clamp(accuracy, 0.1, 0.95);

  const double threshold = std::clamp(options_.imbalance_threshold, 0.05, 0.4);
  if (result.accuracy < 0.5) {
    result.signal = domain::Signal::Hold;
  } else if (result.orderbook_imbalance > threshold) {
    result.signal = domain::Signal::Buy;
  } else if (result.orderbook_imbalance < -threshold) {
    result.signal = domain::Signal::Sell;
  } else {
    result.signal = domain::Signal::Hold;
  }

  result.recommended_action = recommendedAction(result.signal, result.accuracy);
  return result;
}

std::string OrderbookImbalanceResearch::recommendedAction(domain::Signal signal,
                                                          double accuracy) {
  if (signal == domain::Signal::Hold) {
    return "Wait for better signal";
  }
  const std::string name = domain::toString(signal);
  if (accuracy >= 0.85) {
    return "Execute " + name + " trade (high confidence)";
  }
  if (accuracy >= 0.7) {
    return "Consider " + name + " trade (moderate confidence)";
  }
  return "Monitor " + name + " signal (low confidence)";
}

}  // namespace autotrade

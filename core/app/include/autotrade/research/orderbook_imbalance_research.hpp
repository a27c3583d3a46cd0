#pragma once

#include "autotrade/domain/orderbook.hpp"
#include "autotrade/research/i_research_provider.hpp"
#include "autotrade/time/i_time_provider.hpp"

#include <cstddef>

namespace autotrade {

// -----------------------------------------------------------------------------
// OrderbookImbalanceResearch: microstructure research on a depth snapshot
// -----------------------------------------------------------------------------
//
// @brief  Derives a BUY/SELL/HOLD signal and a confidence ("accuracy") from
//         order book imbalance, spread and displayed liquidity.
//
// @details
//   imbalance = (bid qty − ask qty) / (bid qty + ask qty) over the top
//               imbalance_levels levels; 0 for an empty or zero-volume book.
//   accuracy  = 0.5
//             + 0.15 / 0.10 / 0.05 when |imbalance| > 0.30 / 0.15 / 0.05
//             + 0.15 / 0.10 / 0.05 when spread % of mid < 0.05 / 0.10 / 0.20
//             + 0.15 / 0.10 / 0.05 when top-5 notional > 500k / 100k / 50k
//             + 0.10 / 0.05        when top-5 notional > 1M / 500k
//             clamped to [0.10, 0.95].
//   signal    = HOLD if accuracy < 0.5, else BUY / SELL when imbalance is
//               beyond ±threshold (threshold clamped to [0.05, 0.40]), else
//               HOLD.
//
// Stateless apart from its options; safe for concurrent use.
// -----------------------------------------------------------------------------
class OrderbookImbalanceResearch final : public IResearchProvider {
 public:
  struct Options {
    std::size_t depth{20};
    std::size_t imbalance_levels{10};
    double imbalance_threshold{0.2};
  };

  explicit OrderbookImbalanceResearch(const ITimeProvider& clock)
      : OrderbookImbalanceResearch(clock, Options{}) {}

  OrderbookImbalanceResearch(const ITimeProvider& clock, Options options);

  domain::ResearchResult runResearch(const std::string& symbol,
                                     const std::string& user_id,
                                     IMarketDataSource& market) override;

  // Pure analysis of one snapshot; runResearch() fetches and delegates here.
  domain::ResearchResult analyze(const domain::Orderbook& book) const;

  static double imbalance(const domain::Orderbook& book, std::size_t levels);

  static std::string recommendedAction(domain::Signal signal, double accuracy);

 private:
  const ITimeProvider& clock_;
  const Options options_;
};

}  // namespace autotrade

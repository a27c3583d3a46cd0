#pragma once

#include "autotrade/domain/orderbook.hpp"
#include "autotrade/domain/research.hpp"

#include <optional>

namespace autotrade {

// -----------------------------------------------------------------------------
// IStrategy: one initialized strategy instance for one user
// -----------------------------------------------------------------------------
// Created by a StrategyRegistry factory. decide() may be called from the
// user's orchestrator thread only, so instances need no internal locking.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual std::optional<domain::TradeDecision> decide(
      const domain::ResearchResult& research,
      const domain::Orderbook& orderbook) = 0;
};

}  // namespace autotrade

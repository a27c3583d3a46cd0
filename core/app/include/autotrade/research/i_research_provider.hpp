#pragma once

#include "autotrade/domain/research.hpp"
#include "autotrade/market/i_market_data_source.hpp"

#include <string>

namespace autotrade {

// -----------------------------------------------------------------------------
// IResearchProvider: produces the signal the orchestrator gates on
// -----------------------------------------------------------------------------
// Throws on data failures; the orchestrator logs the failure and skips the
// cycle.
// -----------------------------------------------------------------------------
class IResearchProvider {
 public:
  virtual ~IResearchProvider() = default;

  virtual domain::ResearchResult runResearch(const std::string& symbol,
                                             const std::string& user_id,
                                             IMarketDataSource& market) = 0;
};

}  // namespace autotrade

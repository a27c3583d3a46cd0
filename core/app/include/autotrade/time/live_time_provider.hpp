#pragma once

#include "autotrade/time/i_time_provider.hpp"

namespace autotrade {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns std::chrono::system_clock::now() in epoch milliseconds.
//
// @details
// Used by the production binary. Stateless, so one instance is shared by
// every user's engines and by RiskManager.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace autotrade

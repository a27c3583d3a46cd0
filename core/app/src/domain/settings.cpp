#include "autotrade/domain/settings.hpp"

namespace autotrade {
namespace domain {

const char* toString(EngineStatus s) {
  switch (s) {
    case EngineStatus::Active:       return "active";
    case EngineStatus::PausedManual: return "paused_manual";
    case EngineStatus::PausedByRisk: return "paused_by_risk";
  }
  return "unknown";
}

std::optional<EngineStatus> engineStatusFromString(const std::string& s) {
  if (s == "active") return EngineStatus::Active;
  if (s == "paused_manual") return EngineStatus::PausedManual;
  if (s == "paused_by_risk") return EngineStatus::PausedByRisk;
  return std::nullopt;
}

}  // namespace domain
}  // namespace autotrade

#pragma once

namespace autotrade {

// -----------------------------------------------------------------------------
// Drive: who advances an engine's cycles
// -----------------------------------------------------------------------------
//   Threaded  start() spawns the engine's worker; cycles run on their own.
//   Manual    start() only arms the engine; the owner calls runCycle().
//             Used by tests and replay tools for deterministic stepping.
// -----------------------------------------------------------------------------
enum class Drive {
  Threaded,
  Manual,
};

}  // namespace autotrade

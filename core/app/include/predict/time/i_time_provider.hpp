#pragma once

#include <cstdint>

namespace predict {

// -----------------------------------------------------------------------------
// ITimeProvider — the engine's only source of "now"
// -----------------------------------------------------------------------------
//
// @brief  Milliseconds since the Unix epoch. Used for market expiry checks,
//         market creation stamps, and transaction / telemetry timestamps.
//
// @details
// Production wires LiveTimeProvider (system clock). Tests wire
// SimulationTimeProvider so expiry can be crossed deterministically.
//
// Thread model:
//   now_ms() is called concurrently from every trade worker; implementations
//   must be thread-safe.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace predict

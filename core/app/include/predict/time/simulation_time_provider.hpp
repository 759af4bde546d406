#pragma once

#include "predict/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace predict {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — manually driven clock
// -----------------------------------------------------------------------------
// Starts at `start_ms` and only moves when set_time() or advance_by() is
// called. Backed by an atomic so worker threads can read it while a test
// thread moves it.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void set_time(std::int64_t new_time_ms);

  // Returns the new time.
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace predict

#include "predict/time/live_time_provider.hpp"

#include <chrono>

namespace predict {

std::int64_t LiveTimeProvider::now_ms() const {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
      .count();
}

}  // namespace predict

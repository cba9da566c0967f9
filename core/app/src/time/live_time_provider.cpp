#include "evcore/time/live_time_provider.hpp"

namespace evcore {

// -----------------------------------------------------------------------------
// now_ms(): elapsed steady-clock time since construction
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ms() const {
  auto elapsed = std::chrono::steady_clock::now() - origin_;
  return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)
      .count();
}

}  // namespace evcore

#include "evcore/time/simulation_time_provider.hpp"

namespace evcore {

bool SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  if (new_time_ms <= current_time_ms_) {
    return false;
  }
  current_time_ms_ = new_time_ms;
  return true;
}

void SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  if (delta_ms > 0) {
    current_time_ms_ += delta_ms;
  }
}

}  // namespace evcore

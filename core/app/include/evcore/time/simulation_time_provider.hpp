#pragma once

#include "evcore/time/i_time_provider.hpp"

#include <cstdint>

namespace evcore {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" only moves when someone calls
//         advance_time() or advance_by().
//
// @details
// Used by tests and by SimulatedWakeSource. A handler can call advance_by()
// to pretend it blocked the loop for a while, which is how the timer
// catch-up behaviour is exercised without sleeping.
//
// Monotonicity:
//   advance_time() ignores values earlier than the current time. The loop's
//   timer arithmetic assumes time never goes backwards.
//
// Thread model: Single execution context; plain integer, no atomic.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override { return current_time_ms_; }

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock to new_time_ms if that is later than now.
  // @return true if the clock moved.
  // -------------------------------------------------------------------------
  bool advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms (negative deltas are ignored).
  void advance_by(std::int64_t delta_ms);

 private:
  std::int64_t current_time_ms_;
};

}  // namespace evcore

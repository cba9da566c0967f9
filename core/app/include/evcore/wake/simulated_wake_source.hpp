#pragma once

#include "evcore/time/simulation_time_provider.hpp"
#include "evcore/wake/i_wake_source.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace evcore {

// -----------------------------------------------------------------------------
// SimulatedWakeSource - deterministic waiting for tests and replays
// -----------------------------------------------------------------------------
//
// @brief  Instead of sleeping, jumps a SimulationTimeProvider forward to the
//         moment the loop asked to be woken, and replays scheduled external
//         stimuli at their simulated times.
//
// @details
// waitForWork(timeout):
//   1. If a stimulus is scheduled at or before now + timeout (or any
//      stimulus at all when timeout < 0), the clock jumps to its time, every
//      stimulus scheduled for that instant runs in scheduling order, and the
//      call returns true.
//   2. Otherwise, with timeout >= 0, the clock jumps by timeout and the call
//      returns false (the loop will now find its timer due).
//   3. Otherwise (no timer armed, nothing scheduled) nothing can ever wake
//      the loop: throws DispatchError(LoopStalled) instead of hanging.
//
// Stimuli are plain callables, typically capturing the loop and calling
// post() or requestQuit().
// -----------------------------------------------------------------------------
class SimulatedWakeSource final : public IWakeSource {
 public:
  using Stimulus = std::function<void()>;

  explicit SimulatedWakeSource(SimulationTimeProvider& clock);

  // Schedules a stimulus at absolute simulated time at_ms.
  void schedule(std::int64_t at_ms, Stimulus stimulus);

  bool waitForWork(std::int64_t timeout_ms) override;

  std::size_t waitCount() const { return wait_count_; }

  std::size_t pendingStimuli() const { return stimuli_.size(); }

 private:
  SimulationTimeProvider& clock_;
  std::multimap<std::int64_t, Stimulus> stimuli_;
  std::size_t wait_count_{0};
};

}  // namespace evcore

#include "evcore/wake/simulated_wake_source.hpp"
#include "evcore/errors/dispatch_error.hpp"

#include <utility>
#include <vector>

namespace evcore {

SimulatedWakeSource::SimulatedWakeSource(SimulationTimeProvider& clock)
    : clock_(clock) {}

void SimulatedWakeSource::schedule(std::int64_t at_ms, Stimulus stimulus) {
  // multimap keeps insertion order among equal keys.
  stimuli_.emplace(at_ms, std::move(stimulus));
}

// -----------------------------------------------------------------------------
// waitForWork(): jump the clock instead of sleeping
// -----------------------------------------------------------------------------
bool SimulatedWakeSource::waitForWork(std::int64_t timeout_ms) {
  ++wait_count_;
  const std::int64_t now = clock_.now_ms();

  if (!stimuli_.empty()) {
    const std::int64_t at = stimuli_.begin()->first;
    if (timeout_ms < 0 || at <= now + timeout_ms) {
      clock_.advance_time(at);

      // Detach this instant's stimuli before running them: a stimulus may
      // schedule more work, which must not be replayed in this call.
      std::vector<Stimulus> batch;
      auto range = stimuli_.equal_range(at);
      for (auto it = range.first; it != range.second; ++it) {
        batch.push_back(std::move(it->second));
      }
      stimuli_.erase(range.first, range.second);

      for (auto& stimulus : batch) {
        stimulus();
      }
      return true;
    }
  }

  if (timeout_ms >= 0) {
    clock_.advance_by(timeout_ms);
    return false;
  }

  throw DispatchError(ErrorKind::LoopStalled,
                      "loop is idle at t=" + std::to_string(now) +
                          " ms with no timers and no scheduled stimuli");
}

}  // namespace evcore

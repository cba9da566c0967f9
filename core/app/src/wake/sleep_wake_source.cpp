#include "evcore/wake/sleep_wake_source.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace evcore {

SleepWakeSource::SleepWakeSource(std::int64_t slice_ms, PollHook hook)
    : slice_ms_(slice_ms > 0 ? slice_ms : kDefaultSliceMs),
      hook_(std::move(hook)) {}

bool SleepWakeSource::poll() { return hook_ ? hook_() : false; }

// -----------------------------------------------------------------------------
// waitForWork(): sliced sleep with a hook check after every slice
// -----------------------------------------------------------------------------
bool SleepWakeSource::waitForWork(std::int64_t timeout_ms) {
  // Work may already be waiting; never sleep past it.
  if (poll()) {
    return true;
  }

  std::int64_t remaining = timeout_ms < 0 ? slice_ms_ : timeout_ms;

  while (remaining > 0) {
    std::int64_t step = std::min(remaining, slice_ms_);
    std::this_thread::sleep_for(std::chrono::milliseconds(step));
    remaining -= step;

    if (poll()) {
      return true;
    }
  }
  return false;
}

}  // namespace evcore

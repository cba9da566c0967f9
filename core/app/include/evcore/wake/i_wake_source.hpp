#pragma once

#include <cstdint>
#include <functional>

namespace evcore {

// -----------------------------------------------------------------------------
// IWakeSource - the loop's only blocking point
// -----------------------------------------------------------------------------
//
// @brief  Whatever the loop waits on when it has nothing to deliver.
//
// @details
// The loop never multiplexes I/O itself. When its queue is empty it calls
// waitForWork() with the time left until the next timer deadline and resumes
// iterating when the call returns. An implementation may, while waiting,
// feed external stimuli into the loop (post events, request quit) by calling
// the loop's public API; the loop picks them up on its next iteration.
//
// Contract:
//   - timeout_ms >= 0: return no later than timeout_ms from now (0 = poll).
//   - timeout_ms < 0:  no timer is armed; wait as long as the source likes.
//     Returning early without work is allowed; the loop simply asks again.
//   - Return true if external work was delivered into the loop, false if the
//     wait just ran out.
//
// Implementations:
//   SleepWakeSource      → sleeps in slices and polls a host hook.
//   SimulatedWakeSource  → advances a SimulationTimeProvider (tests).
//   ControlChannel       → ZeroMQ command socket.
// -----------------------------------------------------------------------------
class IWakeSource {
 public:
  virtual ~IWakeSource() = default;

  virtual bool waitForWork(std::int64_t timeout_ms) = 0;
};

// -----------------------------------------------------------------------------
// PollHook
// -----------------------------------------------------------------------------
// Host callback that wake sources invoke between waiting slices. Returns true
// if it pushed work into the loop (e.g. a SIGINT flag turned into
// requestQuit()). Empty hooks are allowed and mean "nothing external".
// -----------------------------------------------------------------------------
using PollHook = std::function<bool()>;

}  // namespace evcore

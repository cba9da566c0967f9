#pragma once

#include "evcore/events/event.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace evcore {

using TimerId = std::uint64_t;

enum class TimerMode { OneShot, Repeating };

// -----------------------------------------------------------------------------
// TimerPayload
// -----------------------------------------------------------------------------
// Payload carried by every BuiltinEventType::Timer event. deadline_ms is the
// deadline that became due; fired_at_ms is the clock reading when the loop
// noticed it. The difference is how late the tick is.
// -----------------------------------------------------------------------------
struct TimerPayload {
  TimerId timer_id{0};
  std::int64_t deadline_ms{0};
  std::int64_t fired_at_ms{0};
};

// One expiry found by collectDue(). The loop turns each into a timer event.
struct DueTimer {
  TimerId id{0};
  TargetRef target;
  std::int64_t deadline_ms{0};
};

// -----------------------------------------------------------------------------
// TimerRegistry - armed timers and the next wake deadline
// -----------------------------------------------------------------------------
//
// @brief  Owns every armed timer of one loop. Computes which timers are due
//         at a given instant and rearms or retires them.
//
// @details
// Time is plain int64 milliseconds read from the loop's ITimeProvider; the
// registry never reads a clock itself, which keeps it deterministic under a
// SimulationTimeProvider.
//
// Rearming (repeating timers):
//   nextDeadline advances by whole multiples of the interval until it lies
//   strictly after `now`. The new deadline stays on the original grid
//   (arm time + k * interval), so lateness never accumulates as drift.
//   However many intervals were missed, collectDue() reports the timer once:
//   consumers care that it fired, not how often it should have.
//
// Zero interval:
//   Due immediately at the next collectDue(). A zero one-shot is the
//   "run this once the loop is going" idiom. A zero repeating timer is due on
//   every iteration.
//
// Ordering:
//   Simultaneously-due timers are reported in arm order.
//
// Thread model: Single execution context; no locking.
// -----------------------------------------------------------------------------
class TimerRegistry {
 public:
  TimerRegistry() = default;

  TimerRegistry(const TimerRegistry&) = delete;
  TimerRegistry& operator=(const TimerRegistry&) = delete;

  // -------------------------------------------------------------------------
  // arm(interval_ms, mode, target, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Registers a timer with nextDeadline = now_ms + interval_ms.
  //
  // @param  interval_ms  Must be >= 0.
  // @param  mode         OneShot timers are removed after firing once.
  // @param  target       Receiver of the timer events.
  // @param  now_ms       Current loop time.
  // @return A TimerId unique for the lifetime of this registry (never 0).
  // @throws DispatchError(TimerArmError) for a negative interval.
  // -------------------------------------------------------------------------
  TimerId arm(std::int64_t interval_ms, TimerMode mode, TargetRef target,
              std::int64_t now_ms);

  // Removes the timer. Returns false if it was not armed (never armed,
  // already cancelled, or a one-shot that already fired).
  bool cancel(TimerId id);

  bool isActive(TimerId id) const;

  // Earliest nextDeadline across all armed timers, or nullopt when none.
  std::optional<std::int64_t> nextDeadline() const;

  std::optional<std::int64_t> nextDeadlineOf(TimerId id) const;

  // -------------------------------------------------------------------------
  // collectDue(now_ms)
  // -------------------------------------------------------------------------
  // @brief  Returns every timer with nextDeadline <= now_ms, in arm order,
  //         at most once each. Repeating timers are rearmed, one-shot timers
  //         removed, before this returns.
  // -------------------------------------------------------------------------
  std::vector<DueTimer> collectDue(std::int64_t now_ms);

  std::size_t size() const { return timers_.size(); }

  bool empty() const { return timers_.empty(); }

 private:
  struct Timer {
    TimerId id{0};
    std::int64_t interval_ms{0};
    TimerMode mode{TimerMode::OneShot};
    std::int64_t next_deadline_ms{0};
    TargetRef target;
  };

  const Timer* find(TimerId id) const;

  // Kept in arm order; ids increase monotonically, so this is also id order.
  std::vector<Timer> timers_;
  TimerId next_id_{1};
};

}  // namespace evcore

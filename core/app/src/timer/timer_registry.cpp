#include "evcore/timer/timer_registry.hpp"
#include "evcore/errors/dispatch_error.hpp"

#include <algorithm>
#include <string>

namespace evcore {

// -----------------------------------------------------------------------------
// arm()
// -----------------------------------------------------------------------------
TimerId TimerRegistry::arm(std::int64_t interval_ms, TimerMode mode,
                           TargetRef target, std::int64_t now_ms) {
  if (interval_ms < 0) {
    throw DispatchError(ErrorKind::TimerArmError,
                        "interval must be >= 0 ms, got " +
                            std::to_string(interval_ms));
  }

  Timer timer;
  timer.id = next_id_++;
  timer.interval_ms = interval_ms;
  timer.mode = mode;
  timer.next_deadline_ms = now_ms + interval_ms;
  timer.target = std::move(target);

  timers_.push_back(std::move(timer));
  return timers_.back().id;
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
bool TimerRegistry::cancel(TimerId id) {
  auto it = std::find_if(timers_.begin(), timers_.end(),
                         [id](const Timer& t) { return t.id == id; });
  if (it == timers_.end()) {
    return false;
  }
  timers_.erase(it);
  return true;
}

const TimerRegistry::Timer* TimerRegistry::find(TimerId id) const {
  auto it = std::find_if(timers_.begin(), timers_.end(),
                         [id](const Timer& t) { return t.id == id; });
  return it == timers_.end() ? nullptr : &*it;
}

bool TimerRegistry::isActive(TimerId id) const { return find(id) != nullptr; }

std::optional<std::int64_t> TimerRegistry::nextDeadline() const {
  if (timers_.empty()) {
    return std::nullopt;
  }
  auto earliest = std::min_element(
      timers_.begin(), timers_.end(), [](const Timer& a, const Timer& b) {
        return a.next_deadline_ms < b.next_deadline_ms;
      });
  return earliest->next_deadline_ms;
}

std::optional<std::int64_t> TimerRegistry::nextDeadlineOf(TimerId id) const {
  const Timer* timer = find(id);
  if (timer == nullptr) {
    return std::nullopt;
  }
  return timer->next_deadline_ms;
}

// -----------------------------------------------------------------------------
// collectDue(): report, rearm and retire
// -----------------------------------------------------------------------------
std::vector<DueTimer> TimerRegistry::collectDue(std::int64_t now_ms) {
  std::vector<DueTimer> due;

  for (Timer& timer : timers_) {
    if (timer.next_deadline_ms > now_ms) {
      continue;
    }

    due.push_back(DueTimer{timer.id, timer.target, timer.next_deadline_ms});

    if (timer.mode == TimerMode::Repeating) {
      if (timer.interval_ms == 0) {
        timer.next_deadline_ms = now_ms;
      } else {
        // Whole intervals elapsed since the deadline, plus the one that puts
        // us past now. Missed ticks collapse into the single report above.
        std::int64_t missed = (now_ms - timer.next_deadline_ms) / timer.interval_ms;
        timer.next_deadline_ms += (missed + 1) * timer.interval_ms;
      }
    }
  }

  timers_.erase(std::remove_if(timers_.begin(), timers_.end(),
                               [now_ms](const Timer& t) {
                                 return t.mode == TimerMode::OneShot &&
                                        t.next_deadline_ms <= now_ms;
                               }),
                timers_.end());

  return due;
}

}  // namespace evcore

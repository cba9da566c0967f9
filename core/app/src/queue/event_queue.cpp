#include "evcore/queue/event_queue.hpp"

#include <algorithm>
#include <iterator>

namespace evcore {

// -----------------------------------------------------------------------------
// popNext(): timer lane first, alternating while both lanes hold work
// -----------------------------------------------------------------------------
std::optional<Event> EventQueue::popNext() {
  const bool take_timer =
      !timers_.empty() && (posted_.empty() || !last_from_timer_lane_);

  std::deque<Event>* lane = nullptr;
  if (take_timer) {
    lane = &timers_;
  } else if (!posted_.empty()) {
    lane = &posted_;
  } else {
    return std::nullopt;
  }

  Event event = std::move(lane->front());
  lane->pop_front();
  last_from_timer_lane_ = take_timer;
  return event;
}

// -----------------------------------------------------------------------------
// discardTimerEvents(): erase-remove over the timer lane only
// -----------------------------------------------------------------------------
std::size_t EventQueue::discardTimerEvents(
    const std::function<bool(const Event&)>& pred) {
  auto new_end = std::remove_if(timers_.begin(), timers_.end(), pred);
  auto removed = static_cast<std::size_t>(std::distance(new_end, timers_.end()));
  timers_.erase(new_end, timers_.end());
  return removed;
}

}  // namespace evcore

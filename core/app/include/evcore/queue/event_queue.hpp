#pragma once

#include "evcore/events/event.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>

namespace evcore {

// -----------------------------------------------------------------------------
// EventQueue
// -----------------------------------------------------------------------------
// Responsibility: Ordered buffer of events waiting for delivery. post()
// appends to the tail; popNext() removes the next event to deliver.
//
// Two lanes:
//   - posted lane: everything handed to EventLoop::post(). Plain FIFO across
//     all targets, so two events for the same target are always delivered in
//     post order.
//   - timer lane: timer-expiry events produced by the TimerRegistry. Also
//     FIFO among themselves (registry order).
//
// popNext() prefers the timer lane, but never takes from it twice in a row
// while the posted lane has work. That lets a zero-interval timer run before
// events that were already pending when it expired, while a timer that is
// due on every iteration still cannot starve posted events.
//
// post() and postTimer() are pure appends. Nothing is delivered from inside
// them; delivery only happens when the loop pops, which is what keeps posting
// from re-entering a handler.
//
// Thread model: Single execution context; no mutex. Safe to call from inside
// a handler that is currently being delivered (the popped event has already
// left the deque).
// -----------------------------------------------------------------------------
class EventQueue {
 public:
  EventQueue() = default;

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  void post(Event event) { posted_.push_back(std::move(event)); }

  void postTimer(Event event) { timers_.push_back(std::move(event)); }

  // -------------------------------------------------------------------------
  // popNext()
  // -------------------------------------------------------------------------
  // Output: the next event by the lane rule above, or std::nullopt when both
  // lanes are empty. Never blocks.
  // -------------------------------------------------------------------------
  std::optional<Event> popNext();

  // -------------------------------------------------------------------------
  // discardTimerEvents(pred)
  // -------------------------------------------------------------------------
  // Removes queued timer-lane events for which pred returns true. Used when a
  // timer is cancelled so a tick that was already queued never reaches its
  // target. Posted events are never discarded.
  // Output: number of events removed.
  // -------------------------------------------------------------------------
  std::size_t discardTimerEvents(const std::function<bool(const Event&)>& pred);

  bool empty() const { return posted_.empty() && timers_.empty(); }

  std::size_t size() const { return posted_.size() + timers_.size(); }

  std::size_t postedCount() const { return posted_.size(); }

  std::size_t timerCount() const { return timers_.size(); }

 private:
  std::deque<Event> posted_;
  std::deque<Event> timers_;

  // True when the previous popNext() came from the timer lane.
  bool last_from_timer_lane_{false};
};

}  // namespace evcore

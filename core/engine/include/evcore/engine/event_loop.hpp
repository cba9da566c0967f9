#pragma once

#include "evcore/events/event.hpp"
#include "evcore/events/event_handler.hpp"
#include "evcore/events/event_type_registry.hpp"
#include "evcore/filter/filter_chain.hpp"
#include "evcore/queue/event_queue.hpp"
#include "evcore/signal/signal_bus.hpp"
#include "evcore/time/i_time_provider.hpp"
#include "evcore/timer/timer_registry.hpp"
#include "evcore/wake/i_wake_source.hpp"

#include <any>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace evcore {

enum class LoopState { Idle, Running, QuitPending, Stopped };

const char* loopStateToString(LoopState state);

// Behaviour switches that are not part of the dispatch semantics.
struct LoopOptions {
  // Log one line per delivered, filtered or dropped event on stdout.
  bool trace_deliveries{false};
};

// Running counters since construction (not reset by run()).
struct LoopStats {
  std::uint64_t delivered{0};     // handler invoked
  std::uint64_t unhandled{0};     // handler invoked and returned false
  std::uint64_t filtered{0};      // consumed by an interceptor
  std::uint64_t dropped{0};       // target vanished before delivery
  std::uint64_t timer_events{0};  // timer expiries queued
  std::uint64_t external_wakeups{0};  // wake source reported outside work
};

// -----------------------------------------------------------------------------
// EventLoop - the single-threaded dispatch driver
// -----------------------------------------------------------------------------
//
// @brief  Owns the event queue, timer registry, filter chain, signal bus and
//         event-type registry of one loop, and drives delivery.
//
// @details
// One iteration of run():
//   1. If a quit was requested, stop (see below).
//   2. Merge due timers: every due timer queues one Timer event, unless a
//      tick of that timer is still queued. At most one tick per timer waits
//      in the queue; later expiries coalesce into it.
//   3. Pop one event. If none, wait on the IWakeSource until the next timer
//      deadline and start over.
//   4. If the target is gone, drop the event (TargetVanished, logged).
//   5. Run the filter chain; a Consumed result ends delivery.
//   6. Invoke the target's handler.
//
// Cooperative quit:
//   requestQuit() only records the request. The handler that called it (and
//   every slot it emitted to, and every slot those emitted to) runs to the
//   end; the request is honoured at step 1 of the next iteration. On the way
//   out the loop emits kAboutToQuit on its own signal bus (emitter = this),
//   then returns the requested exit code from run().
//
// Faults:
//   An exception thrown by a handler, interceptor or slot is logged and
//   propagates out of run() unchanged. The loop is Stopped; whatever was
//   delivered before stays delivered, and events still queued stay queued
//   for a later run().
//
// States:
//   Idle → Running → QuitPending → Stopped. run() may be called again from
//   Stopped; it starts a fresh run and clears any stale quit request. Calling
//   run() from inside a handler of the same loop throws
//   DispatchError(LoopReentered).
//
// Thread model:
//   Everything happens on the thread that calls run(). All public operations
//   may be called from inside a handler, filter or slot of this loop.
//
// Ownership:
//   Borrows the time provider and wake source (both must outlive the loop).
//   Owns everything else. Targets are owned by the host and only weakly
//   referenced here, except handlers the loop creates for callback timers.
// -----------------------------------------------------------------------------
class EventLoop {
 public:
  static constexpr const char* kAboutToQuit = "aboutToQuit";

  EventLoop(const ITimeProvider& clock, IWakeSource& wake_source,
            LoopOptions options = {});

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop(EventLoop&&) = delete;
  EventLoop& operator=(EventLoop&&) = delete;

  // --- Event types ----------------------------------------------------------

  EventTypeRegistry& eventTypes() { return types_; }
  const EventTypeRegistry& eventTypes() const { return types_; }

  // Shorthand for eventTypes().registerEventType(name).
  TypeId registerEventType(const std::string& name);

  // --- Posting --------------------------------------------------------------

  // -------------------------------------------------------------------------
  // post(target, type, payload)
  // -------------------------------------------------------------------------
  // What: Appends an event to the tail of the queue. Nothing is delivered
  // before post() returns, even when called from inside a handler.
  // A target that is already gone (or disappears later) is not an error at
  // this point; the event is dropped at delivery time.
  // Throws: DispatchError(UnknownEventType) if `type` was never registered.
  // -------------------------------------------------------------------------
  void post(const TargetRef& target, TypeId type, std::any payload = {});

  // --- Timers ---------------------------------------------------------------

  // -------------------------------------------------------------------------
  // startTimer(interval_ms, mode, target)
  // -------------------------------------------------------------------------
  // What: Arms a timer whose expiries are delivered to `target` as
  // BuiltinEventType::Timer events carrying a TimerPayload.
  // Throws: DispatchError(TimerArmError) for a negative interval.
  // -------------------------------------------------------------------------
  TimerId startTimer(std::int64_t interval_ms, TimerMode mode,
                     TargetRef target);

  // Same, but each expiry invokes `callback` (the loop owns the target that
  // wraps it). Timer events still pass through the filter chain first.
  TimerId startTimer(std::int64_t interval_ms, TimerMode mode,
                     std::function<void()> callback);

  // One-shot callback. singleShot(0, fn) runs fn on the first iteration of
  // the next run(), ahead of events that were posted before it.
  TimerId singleShot(std::int64_t interval_ms, std::function<void()> callback);

  // Disarms the timer and discards any of its ticks still queued. Returns
  // false if the timer was neither armed nor had a tick waiting.
  bool cancelTimer(TimerId id);

  bool isTimerActive(TimerId id) const { return timers_.isActive(id); }

  // --- Filters --------------------------------------------------------------

  FilterId installEventFilter(FilterScope scope,
                              FilterChain::Interceptor interceptor);

  bool removeEventFilter(FilterId id);

  // --- Signals --------------------------------------------------------------

  SignalBus& signalBus() { return bus_; }
  const SignalBus& signalBus() const { return bus_; }

  // --- Running --------------------------------------------------------------

  // -------------------------------------------------------------------------
  // run()
  // -------------------------------------------------------------------------
  // What: Runs iterations until a quit request is honoured, then returns the
  // exit code passed to requestQuit().
  // Throws: whatever a handler/filter/slot threw (loop left Stopped);
  //         DispatchError(LoopReentered) if the loop is already running;
  //         anything the wake source throws.
  // -------------------------------------------------------------------------
  int run();

  // -------------------------------------------------------------------------
  // processEvents()
  // -------------------------------------------------------------------------
  // What: Non-blocking variant. Merges due timers once and delivers the
  // events queued at the moment of the call (events posted meanwhile wait
  // for the next call). Never waits, never honours or clears a quit request.
  // Output: number of events popped (delivered, filtered or dropped).
  // -------------------------------------------------------------------------
  std::size_t processEvents();

  // -------------------------------------------------------------------------
  // requestQuit(exit_code)
  // -------------------------------------------------------------------------
  // What: Records a quit request and the exit code. Never throws and never
  // unwinds the caller. Repeated requests keep the latest exit code.
  // -------------------------------------------------------------------------
  void requestQuit(int exit_code = 0) noexcept;

  LoopState state() const { return state_; }

  bool isRunning() const { return running_; }

  bool quitRequested() const { return quit_requested_; }

  const LoopStats& stats() const { return stats_; }

  std::size_t pendingEvents() const { return queue_.size(); }

  std::size_t activeTimers() const { return timers_.size(); }

  std::int64_t now_ms() const { return clock_.now_ms(); }

 private:
  void mergeDueTimers();

  // Pops one event and delivers it. Returns false if the queue was empty.
  bool dispatchNext();

  void deliver(const Event& event);

  // Releases the loop-owned handler of a callback timer that will not fire
  // again. Also runs when delivery of the timer's last tick throws.
  void releaseFinishedTimer(const Event& event);

  std::int64_t waitTimeout() const;

  void finishRun();

  void trace(const char* what, const Event& event) const;

  const ITimeProvider& clock_;
  IWakeSource& wake_source_;
  LoopOptions options_;

  EventTypeRegistry types_;
  EventQueue queue_;
  TimerRegistry timers_;
  FilterChain filters_;
  SignalBus bus_;

  // Targets created for callback timers, keyed by timer id. The loop is
  // their only owner, so erasing an entry makes queued ticks vanish.
  std::unordered_map<TimerId, std::shared_ptr<IEventHandler>> timer_callbacks_;

  // Timers that have a tick waiting in the timer lane.
  std::unordered_set<TimerId> queued_ticks_;

  LoopState state_{LoopState::Idle};
  bool running_{false};
  bool quit_requested_{false};
  int exit_code_{0};
  std::uint64_t next_sequence_id_{1};
  LoopStats stats_;
};

}  // namespace evcore

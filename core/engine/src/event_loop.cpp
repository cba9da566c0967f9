#include "evcore/engine/event_loop.hpp"
#include "evcore/errors/dispatch_error.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace evcore {

const char* loopStateToString(LoopState state) {
  switch (state) {
    case LoopState::Idle:        return "Idle";
    case LoopState::Running:     return "Running";
    case LoopState::QuitPending: return "QuitPending";
    case LoopState::Stopped:     return "Stopped";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
EventLoop::EventLoop(const ITimeProvider& clock, IWakeSource& wake_source,
                     LoopOptions options)
    : clock_(clock), wake_source_(wake_source), options_(options) {}

TypeId EventLoop::registerEventType(const std::string& name) {
  return types_.registerEventType(name);
}

// -----------------------------------------------------------------------------
// post(): validate the kind now, deliver later
// -----------------------------------------------------------------------------
void EventLoop::post(const TargetRef& target, TypeId type, std::any payload) {
  if (!types_.isRegistered(type)) {
    throw DispatchError(ErrorKind::UnknownEventType,
                        "cannot post event type " + std::to_string(type) +
                            ", it was never registered");
  }
  queue_.post(Event(type, std::move(payload), target, next_sequence_id_++));
}

// -----------------------------------------------------------------------------
// Timers
// -----------------------------------------------------------------------------
TimerId EventLoop::startTimer(std::int64_t interval_ms, TimerMode mode,
                              TargetRef target) {
  return timers_.arm(interval_ms, mode, std::move(target), clock_.now_ms());
}

TimerId EventLoop::startTimer(std::int64_t interval_ms, TimerMode mode,
                              std::function<void()> callback) {
  // The loop is the only owner of this handler; timer_callbacks_ keeps it
  // alive exactly as long as the timer can still fire.
  auto handler = makeHandler([cb = std::move(callback)](const Event&) {
    if (cb) {
      cb();
    }
    return true;
  });

  TimerId id = timers_.arm(interval_ms, mode, handler, clock_.now_ms());
  timer_callbacks_.emplace(id, std::move(handler));
  return id;
}

TimerId EventLoop::singleShot(std::int64_t interval_ms,
                              std::function<void()> callback) {
  return startTimer(interval_ms, TimerMode::OneShot, std::move(callback));
}

bool EventLoop::cancelTimer(TimerId id) {
  const bool armed = timers_.cancel(id);

  // A one-shot that already expired is no longer armed, but its tick may
  // still be queued. Cancelling it must stop that delivery too.
  std::size_t discarded = queue_.discardTimerEvents([id](const Event& e) {
    const auto* payload = e.payloadAs<TimerPayload>();
    return e.is(BuiltinEventType::Timer) && payload != nullptr &&
           payload->timer_id == id;
  });

  queued_ticks_.erase(id);
  timer_callbacks_.erase(id);
  return armed || discarded > 0;
}

// -----------------------------------------------------------------------------
// Filters
// -----------------------------------------------------------------------------
FilterId EventLoop::installEventFilter(FilterScope scope,
                                       FilterChain::Interceptor interceptor) {
  return filters_.install(std::move(scope), std::move(interceptor));
}

bool EventLoop::removeEventFilter(FilterId id) { return filters_.remove(id); }

// -----------------------------------------------------------------------------
// requestQuit(): flag only, honoured at the next iteration boundary
// -----------------------------------------------------------------------------
void EventLoop::requestQuit(int exit_code) noexcept {
  quit_requested_ = true;
  exit_code_ = exit_code;
  if (running_) {
    state_ = LoopState::QuitPending;
  }
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
int EventLoop::run() {
  if (running_) {
    throw DispatchError(ErrorKind::LoopReentered,
                        "run() called while the loop is already running");
  }

  // A fresh run forgets requests made while the loop was not running.
  quit_requested_ = false;
  exit_code_ = 0;
  running_ = true;
  state_ = LoopState::Running;

  std::cout << "[EventLoop] running. pending=" << queue_.size()
            << " timers=" << timers_.size() << "\n";

  try {
    while (!quit_requested_) {
      mergeDueTimers();

      if (dispatchNext()) {
        continue;
      }

      if (wake_source_.waitForWork(waitTimeout())) {
        ++stats_.external_wakeups;
      }
    }

    // The quit is being honoured: the last handler and everything it emitted
    // have returned. Observers get one last synchronous notification.
    bus_.emit(this, kAboutToQuit);
  } catch (...) {
    // Not swallowed: mark the run as over and let the fault reach the caller.
    finishRun();
    throw;
  }

  finishRun();
  std::cout << "[EventLoop] stopped. exit_code=" << exit_code_ << "\n";
  return exit_code_;
}

// -----------------------------------------------------------------------------
// processEvents(): one bounded pass, no waiting
// -----------------------------------------------------------------------------
std::size_t EventLoop::processEvents() {
  mergeDueTimers();

  // Only what is queued right now; a handler that keeps re-posting cannot
  // turn this into an endless loop.
  const std::size_t budget = queue_.size();
  std::size_t popped = 0;
  while (popped < budget && dispatchNext()) {
    ++popped;
  }
  return popped;
}

// -----------------------------------------------------------------------------
// mergeDueTimers(): one Timer event per due timer, into the timer lane
// -----------------------------------------------------------------------------
void EventLoop::mergeDueTimers() {
  if (timers_.empty()) {
    return;
  }

  const std::int64_t now = clock_.now_ms();
  for (DueTimer& due : timers_.collectDue(now)) {
    // The registry has already rearmed the timer; the tick that is still
    // waiting stands for this expiry as well.
    if (!queued_ticks_.insert(due.id).second) {
      continue;
    }
    queue_.postTimer(Event(toTypeId(BuiltinEventType::Timer),
                           TimerPayload{due.id, due.deadline_ms, now},
                           std::move(due.target), next_sequence_id_++));
    ++stats_.timer_events;
  }
}

bool EventLoop::dispatchNext() {
  std::optional<Event> event = queue_.popNext();
  if (!event) {
    return false;
  }
  if (event->is(BuiltinEventType::Timer)) {
    if (const auto* payload = event->payloadAs<TimerPayload>()) {
      queued_ticks_.erase(payload->timer_id);
    }
  }
  deliver(*event);
  return true;
}

// -----------------------------------------------------------------------------
// deliver(): vanished check → filter chain → target
// -----------------------------------------------------------------------------
void EventLoop::deliver(const Event& event) {
  // Holding the shared_ptr for the whole delivery keeps the target alive even
  // if the handler drops the host's last reference to itself.
  std::shared_ptr<IEventHandler> target = event.target().lock();

  if (!target) {
    ++stats_.dropped;
    std::cerr << "[EventLoop] " << errorKindToString(ErrorKind::TargetVanished)
              << ": dropping " << types_.nameOf(event.type()) << " #"
              << event.sequenceId() << "\n";
    releaseFinishedTimer(event);
    return;
  }

  try {
    if (filters_.run(event) == FilterResult::Consumed) {
      ++stats_.filtered;
      trace("filtered", event);
    } else {
      const bool handled = target->handle(event);
      ++stats_.delivered;
      if (!handled) {
        ++stats_.unhandled;
      }
      trace(handled ? "delivered" : "unhandled", event);
    }
  } catch (const std::exception& e) {
    std::cerr << "[EventLoop] " << errorKindToString(ErrorKind::HandlerFault)
              << " while delivering " << types_.nameOf(event.type()) << " #"
              << event.sequenceId() << ": " << e.what() << "\n";
    releaseFinishedTimer(event);
    throw;
  } catch (...) {
    releaseFinishedTimer(event);
    throw;
  }

  releaseFinishedTimer(event);
}

void EventLoop::releaseFinishedTimer(const Event& event) {
  if (!event.is(BuiltinEventType::Timer)) {
    return;
  }
  const auto* payload = event.payloadAs<TimerPayload>();
  if (payload == nullptr || timers_.isActive(payload->timer_id)) {
    return;
  }
  timer_callbacks_.erase(payload->timer_id);
}

std::int64_t EventLoop::waitTimeout() const {
  std::optional<std::int64_t> deadline = timers_.nextDeadline();
  if (!deadline) {
    return -1;
  }
  return std::max<std::int64_t>(0, *deadline - clock_.now_ms());
}

void EventLoop::finishRun() {
  running_ = false;
  state_ = LoopState::Stopped;
}

void EventLoop::trace(const char* what, const Event& event) const {
  if (!options_.trace_deliveries) {
    return;
  }
  std::cout << "[EventLoop] " << what << " " << types_.nameOf(event.type())
            << " #" << event.sequenceId() << " t=" << clock_.now_ms()
            << "\n";
}

}  // namespace evcore

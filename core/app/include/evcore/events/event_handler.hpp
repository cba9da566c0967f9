#pragma once

#include "evcore/events/event.hpp"

#include <functional>
#include <memory>

namespace evcore {

// -----------------------------------------------------------------------------
// IEventHandler - capability interface for event targets
// -----------------------------------------------------------------------------
//
// @brief  Anything the loop can deliver an event to.
//
// @details
// handle() returns true when the event was handled. A false return is purely
// informational: the loop counts it but never re-routes the event.
//
// Targets are owned by the host through std::shared_ptr and addressed through
// TargetRef (a weak_ptr). The loop never extends a target's lifetime beyond
// the duration of a single handle() call.
// -----------------------------------------------------------------------------
class IEventHandler {
 public:
  virtual ~IEventHandler() = default;

  virtual bool handle(const Event& event) = 0;
};

// -----------------------------------------------------------------------------
// BaseEventHandler
// -----------------------------------------------------------------------------
// The "base implementation" every target can fall back to: handles nothing.
// Specialised handlers reach it through explicit delegation (see
// CallbackEventHandler) rather than by inheriting from it.
// -----------------------------------------------------------------------------
class BaseEventHandler final : public IEventHandler {
 public:
  bool handle(const Event& /*event*/) override { return false; }
};

// -----------------------------------------------------------------------------
// CallbackEventHandler
// -----------------------------------------------------------------------------
//
// @brief  Adapts a plain callable into a target, with an optional delegate.
//
// @details
// The callable sees every event first. If it returns false the event is
// offered to the delegate, which is how a host handler "handles its own kinds
// and defers everything else to the base implementation". With no delegate a
// false return simply stands.
// -----------------------------------------------------------------------------
class CallbackEventHandler final : public IEventHandler {
 public:
  using HandlerFn = std::function<bool(const Event&)>;

  explicit CallbackEventHandler(HandlerFn fn,
                                std::shared_ptr<IEventHandler> delegate = nullptr);

  bool handle(const Event& event) override;

 private:
  HandlerFn fn_;
  std::shared_ptr<IEventHandler> delegate_;
};

// Convenience factory: the returned shared_ptr is the owning handle the host
// keeps; pass it (or a TargetRef made from it) to EventLoop::post().
std::shared_ptr<IEventHandler> makeHandler(
    CallbackEventHandler::HandlerFn fn,
    std::shared_ptr<IEventHandler> delegate = nullptr);

}  // namespace evcore

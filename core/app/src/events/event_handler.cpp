#include "evcore/events/event_handler.hpp"

#include <utility>

namespace evcore {

CallbackEventHandler::CallbackEventHandler(
    HandlerFn fn, std::shared_ptr<IEventHandler> delegate)
    : fn_(std::move(fn)), delegate_(std::move(delegate)) {}

bool CallbackEventHandler::handle(const Event& event) {
  if (fn_ && fn_(event)) {
    return true;
  }
  return delegate_ ? delegate_->handle(event) : false;
}

std::shared_ptr<IEventHandler> makeHandler(
    CallbackEventHandler::HandlerFn fn,
    std::shared_ptr<IEventHandler> delegate) {
  return std::make_shared<CallbackEventHandler>(std::move(fn),
                                                std::move(delegate));
}

}  // namespace evcore

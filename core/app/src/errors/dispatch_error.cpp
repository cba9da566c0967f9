#include "evcore/errors/dispatch_error.hpp"

namespace evcore {

const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::TargetVanished:      return "TargetVanished";
    case ErrorKind::UnknownEventType:    return "UnknownEventType";
    case ErrorKind::HandlerFault:        return "HandlerFault";
    case ErrorKind::TimerArmError:       return "TimerArmError";
    case ErrorKind::EventTypesExhausted: return "EventTypesExhausted";
    case ErrorKind::LoopReentered:       return "LoopReentered";
    case ErrorKind::LoopStalled:         return "LoopStalled";
    case ErrorKind::ConfigError:         return "ConfigError";
  }
  return "Unknown";
}

// The message is prefixed with the kind so what() alone is enough in logs.
DispatchError::DispatchError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(errorKindToString(kind)) + ": " + message),
      kind_(kind) {}

}  // namespace evcore

#pragma once

#include <stdexcept>
#include <string>

namespace evcore {

// -----------------------------------------------------------------------------
// ErrorKind
// -----------------------------------------------------------------------------
// Classification of everything the runtime can report. Only the caller-fault
// kinds are ever thrown as DispatchError; TargetVanished is recovered inside
// the loop (logged and counted) and HandlerFault is the handler's own
// exception travelling out of EventLoop::run() unchanged.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  TargetVanished,
  UnknownEventType,
  HandlerFault,
  TimerArmError,
  EventTypesExhausted,
  LoopReentered,
  LoopStalled,
  ConfigError,
};

// Human-readable name, used in log lines and control-channel replies.
const char* errorKindToString(ErrorKind kind);

// -----------------------------------------------------------------------------
// DispatchError
// -----------------------------------------------------------------------------
// Responsibility: The single exception type the runtime throws for faults it
// detects at a call boundary (post, startTimer, registerEventType, run, config
// loading). Anything detectable synchronously is rejected synchronously so the
// caller sees it at the call site, not later inside the loop.
//
// Derives from std::runtime_error so generic catch sites keep working; kind()
// lets callers branch without string matching.
// -----------------------------------------------------------------------------
class DispatchError : public std::runtime_error {
 public:
  DispatchError(ErrorKind kind, const std::string& message);

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace evcore

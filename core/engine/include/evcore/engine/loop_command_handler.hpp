#pragma once

#include "evcore/engine/event_loop.hpp"
#include "evcore/events/event.hpp"

#include <map>
#include <string>
#include <vector>

namespace evcore {

// -----------------------------------------------------------------------------
// LoopCommandHandler - text commands → loop operations
// -----------------------------------------------------------------------------
//
// @brief  Executes one command line against an EventLoop and returns a JSON
//         reply. Bound to ControlChannel so external tools can poke a running
//         loop; also usable directly (tests, scripted hosts).
//
// @details
// Commands (whitespace-separated, case-sensitive):
//   PING                              → {"status":"ok","response":"PONG"}
//   STATUS                            → state, pending events, stats
//   QUIT [code]                       → requestQuit(code), default 0
//   POST <target> <event-type> [text] → post() to a registered target name,
//                                       payload is the remaining text as
//                                       std::string (empty if absent)
// Anything else, or a command the loop rejects, yields
//   {"status":"error","response":"<reason>"}.
//
// Commands run on the loop's own thread (ControlChannel is the wake source),
// so they observe the loop between iterations. QUIT therefore follows the
// same cooperative rule as any other requestQuit().
//
// Targets are looked up by name; registerTarget() stores only a weak
// reference, so a destroyed target produces a dropped event, not a crash.
// -----------------------------------------------------------------------------
class LoopCommandHandler {
 public:
  explicit LoopCommandHandler(EventLoop& loop);

  LoopCommandHandler(const LoopCommandHandler&) = delete;
  LoopCommandHandler& operator=(const LoopCommandHandler&) = delete;

  void registerTarget(const std::string& name, TargetRef target);

  std::string execute(const std::string& command);

  // Whitespace split of the verb and its arguments. POST payload text is
  // taken verbatim from the raw command instead.
  static std::vector<std::string> tokenize(const std::string& command);

 private:
  std::string status() const;
  std::string quit(const std::vector<std::string>& tokens);
  std::string postCommand(const std::string& command,
                          const std::vector<std::string>& tokens);

  static std::string ok(const std::string& response);
  static std::string error(const std::string& reason);

  EventLoop& loop_;
  std::map<std::string, TargetRef> targets_;
};

}  // namespace evcore

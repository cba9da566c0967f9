#include "evcore/engine/loop_command_handler.hpp"
#include "evcore/errors/dispatch_error.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace evcore {

namespace {

// Event types may be named ("Greeting") or given as a raw id ("1000").
std::optional<TypeId> resolveType(const EventTypeRegistry& types,
                                  const std::string& token) {
  if (auto by_name = types.findByName(token)) {
    return by_name;
  }
  if (token.empty()) {
    return std::nullopt;
  }
  for (char c : token) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }
  try {
    return static_cast<TypeId>(std::stoul(token));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

// Command text is echoed back verbatim, so invalid UTF-8 is replaced
// (U+FFFD) instead of making dump() throw.
std::string dumpReply(const nlohmann::json& reply) {
  return reply.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Text after the first `skip` whitespace-separated tokens, leading blanks
// removed. Empty if there is none.
std::string remainderAfter(const std::string& command, std::size_t skip) {
  std::size_t pos = 0;
  for (std::size_t i = 0; i < skip; ++i) {
    pos = command.find_first_not_of(" \t", pos);
    if (pos == std::string::npos) {
      return {};
    }
    pos = command.find_first_of(" \t", pos);
    if (pos == std::string::npos) {
      return {};
    }
  }
  pos = command.find_first_not_of(" \t", pos);
  return pos == std::string::npos ? std::string{} : command.substr(pos);
}

}  // namespace

LoopCommandHandler::LoopCommandHandler(EventLoop& loop) : loop_(loop) {}

void LoopCommandHandler::registerTarget(const std::string& name,
                                        TargetRef target) {
  targets_[name] = std::move(target);
}

std::vector<std::string> LoopCommandHandler::tokenize(
    const std::string& command) {
  std::vector<std::string> tokens;
  std::istringstream in(command);
  std::string token;
  while (in >> token) {
    tokens.push_back(std::move(token));
  }
  return tokens;
}

// -----------------------------------------------------------------------------
// execute(): one command line → one JSON reply
// -----------------------------------------------------------------------------
std::string LoopCommandHandler::execute(const std::string& command) {
  const std::vector<std::string> tokens = tokenize(command);
  if (tokens.empty()) {
    return error("Empty command");
  }

  const std::string& verb = tokens.front();
  if (verb == "PING") {
    return ok("PONG");
  }
  if (verb == "STATUS") {
    return status();
  }
  if (verb == "QUIT") {
    return quit(tokens);
  }
  if (verb == "POST") {
    return postCommand(command, tokens);
  }
  return error("Unknown command: " + command);
}

std::string LoopCommandHandler::status() const {
  const LoopStats& stats = loop_.stats();

  nlohmann::json response;
  response["status"] = "ok";
  response["state"] = loopStateToString(loop_.state());
  response["quit_requested"] = loop_.quitRequested();
  response["pending_events"] = loop_.pendingEvents();
  response["active_timers"] = loop_.activeTimers();
  response["now_ms"] = loop_.now_ms();

  nlohmann::json stats_json;
  stats_json["delivered"] = stats.delivered;
  stats_json["unhandled"] = stats.unhandled;
  stats_json["filtered"] = stats.filtered;
  stats_json["dropped"] = stats.dropped;
  stats_json["timer_events"] = stats.timer_events;
  stats_json["external_wakeups"] = stats.external_wakeups;
  response["stats"] = std::move(stats_json);

  return dumpReply(response);
}

std::string LoopCommandHandler::quit(const std::vector<std::string>& tokens) {
  int code = 0;
  if (tokens.size() > 1) {
    try {
      std::size_t used = 0;
      code = std::stoi(tokens[1], &used);
      if (used != tokens[1].size()) {
        return error("Invalid exit code: " + tokens[1]);
      }
    } catch (const std::logic_error&) {
      return error("Invalid exit code: " + tokens[1]);
    }
  }

  loop_.requestQuit(code);
  return ok("Quit requested with code " + std::to_string(code));
}

// -----------------------------------------------------------------------------
// postCommand(): POST <target> <event-type> [payload text]
// -----------------------------------------------------------------------------
std::string LoopCommandHandler::postCommand(
    const std::string& command, const std::vector<std::string>& tokens) {
  if (tokens.size() < 3) {
    return error("Usage: POST <target> <event-type> [payload]");
  }

  auto target = targets_.find(tokens[1]);
  if (target == targets_.end()) {
    return error("Unknown target: " + tokens[1]);
  }

  std::optional<TypeId> type = resolveType(loop_.eventTypes(), tokens[2]);
  if (!type) {
    return error("Unknown event type: " + tokens[2]);
  }

  try {
    loop_.post(target->second, *type, remainderAfter(command, 3));
  } catch (const DispatchError& e) {
    return error(e.what());
  }

  return ok("Posted " + loop_.eventTypes().nameOf(*type) + " to " +
            tokens[1]);
}

std::string LoopCommandHandler::ok(const std::string& response) {
  nlohmann::json j;
  j["status"] = "ok";
  j["response"] = response;
  return dumpReply(j);
}

std::string LoopCommandHandler::error(const std::string& reason) {
  nlohmann::json j;
  j["status"] = "error";
  j["response"] = reason;
  return dumpReply(j);
}

}  // namespace evcore

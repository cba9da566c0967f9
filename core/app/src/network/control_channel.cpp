#include "evcore/network/control_channel.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace evcore {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
ControlChannel::ControlChannel(CommandHandler command_handler,
                               std::string endpoint, PollHook hook,
                               std::int64_t slice_ms)
    : command_handler_(std::move(command_handler)),
      endpoint_(std::move(endpoint)),
      hook_(std::move(hook)),
      slice_ms_(slice_ms > 0 ? slice_ms : kDefaultSliceMs) {}

ControlChannel::~ControlChannel() { stop(); }

// -----------------------------------------------------------------------------
// start(): context + bound REP socket
// -----------------------------------------------------------------------------
void ControlChannel::start() {
  if (socket_) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  socket_->set(zmq::sockopt::linger, 0);
  socket_->bind(endpoint_);

  std::cout << "[ControlChannel] listening on " << endpoint_ << "\n";
}

void ControlChannel::stop() {
  if (!socket_) {
    return;
  }

  socket_.reset();
  context_.reset();

  std::cout << "[ControlChannel] stopped. commands=" << commands_served_
            << "\n";
}

bool ControlChannel::poll() { return hook_ ? hook_() : false; }

// -----------------------------------------------------------------------------
// waitForWork(): bounded recv, serve at most one command
// -----------------------------------------------------------------------------
bool ControlChannel::waitForWork(std::int64_t timeout_ms) {
  start();

  if (poll()) {
    return true;
  }

  const std::int64_t wait =
      timeout_ms < 0 ? slice_ms_ : std::min(timeout_ms, slice_ms_);
  socket_->set(zmq::sockopt::rcvtimeo, static_cast<int>(wait));

  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      // Interrupted by a signal; the hook is where SIGINT becomes a quit.
      return poll();
    }
    throw;
  }

  if (!result.has_value()) {
    return poll();
  }

  std::string command(static_cast<const char*>(request.data()),
                      request.size());
  // A REP socket must answer every request before it can receive again, so
  // a failing handler still produces a reply.
  std::string response;
  try {
    response = command_handler_(command);
  } catch (const std::exception& e) {
    std::cerr << "[ControlChannel] command failed: " << e.what() << "\n";
    nlohmann::json j;
    j["status"] = "error";
    j["response"] = std::string("Command failed: ") + e.what();
    response =
        j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }

  zmq::message_t reply(response.data(), response.size());
  socket_->send(reply, zmq::send_flags::none);
  ++commands_served_;

  return true;
}

}  // namespace evcore

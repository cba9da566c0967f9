#pragma once

#include "evcore/wake/i_wake_source.hpp"

#include <zmq.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace evcore {

// -----------------------------------------------------------------------------
// ControlChannel - ZeroMQ REP socket as the loop's wake source
// -----------------------------------------------------------------------------
//
// @brief  Lets external clients (a REQ socket, e.g. a Python script) send
//         text commands to a running loop while it is idle.
//
// @details
// The loop blocks in waitForWork() when it has nothing to deliver. Instead of
// sleeping, this source blocks in recv() on a REP socket with ZMQ_RCVTIMEO set
// to the time left until the next timer (capped at slice_ms so the poll hook
// still runs regularly). A received command is passed to the command handler
// (normally LoopCommandHandler::execute()) and its JSON reply is sent back.
//
// Because the handler runs inside waitForWork(), it runs on the loop thread
// between iterations. No locking is involved anywhere.
//
// Thread model:
//   Single thread: the one that calls EventLoop::run().
//
// Ownership:
//   Owns the ZMQ context and socket. Holds a copy of the command handler and
//   poll hook.
// -----------------------------------------------------------------------------
class ControlChannel final : public IWakeSource {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  static constexpr std::int64_t kDefaultSliceMs = 100;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  command_handler  Turns one command string into a reply string.
  // @param  endpoint         ZMQ endpoint for the REP socket.
  // @param  hook             Polled after every receive timeout.
  // @param  slice_ms         Upper bound for one blocking recv().
  //
  // No socket is opened here. start() binds; waitForWork() starts lazily.
  // -------------------------------------------------------------------------
  explicit ControlChannel(CommandHandler command_handler,
                          std::string endpoint = "tcp://127.0.0.1:5560",
                          PollHook hook = {},
                          std::int64_t slice_ms = kDefaultSliceMs);

  ~ControlChannel() override;

  ControlChannel(const ControlChannel&) = delete;
  ControlChannel& operator=(const ControlChannel&) = delete;
  ControlChannel(ControlChannel&&) = delete;
  ControlChannel& operator=(ControlChannel&&) = delete;

  // Creates the context and binds the socket. Idempotent. Throws
  // zmq::error_t if the endpoint cannot be bound.
  void start();

  // Closes the socket and context. Idempotent.
  void stop();

  bool isStarted() const { return socket_ != nullptr; }

  // -------------------------------------------------------------------------
  // waitForWork(timeout_ms)
  // -------------------------------------------------------------------------
  // What: One recv() with rcvtimeo = min(timeout, slice). Serves at most one
  // command per call.
  // Output: true if a command was served or the hook reported work.
  // Throws: zmq::error_t for socket failures other than EINTR. An exception
  // from the command handler is logged and sent back as an error reply.
  // -------------------------------------------------------------------------
  bool waitForWork(std::int64_t timeout_ms) override;

  std::uint64_t commandsServed() const { return commands_served_; }

 private:
  bool poll();

  CommandHandler command_handler_;
  std::string endpoint_;
  PollHook hook_;
  std::int64_t slice_ms_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;

  std::uint64_t commands_served_{0};
};

}  // namespace evcore

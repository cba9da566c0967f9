// =============================================================================
// control_channel_test.cpp
// =============================================================================
// Unit tests for evcore::ControlChannel.
//
// Validates:
//   - A command sent by a REQ client is served inside waitForWork() and the
//     handler's reply comes back
//   - With no command, waitForWork() times out and falls back to the hook
//   - A handler that throws still produces an error reply, and the socket
//     keeps serving
//   - End to end: QUIT over the socket ends EventLoop::run()
//
// Design: Single-threaded. The REQ client's send() is queued by ZeroMQ, so
// the test can send first and then let the channel receive. An ipc://
// endpoint under the test temp dir avoids port clashes.
// =============================================================================

#include "evcore/engine/event_loop.hpp"
#include "evcore/engine/loop_command_handler.hpp"
#include "evcore/network/control_channel.hpp"
#include "evcore/time/live_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <stdexcept>
#include <string>

// =============================================================================
// Test fixture: a client context and a unique ipc endpoint per test.
// =============================================================================
class ControlChannelTest : public ::testing::Test {
 protected:
  zmq::context_t client_context{1};

  std::string endpoint() const {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    return "ipc://" + ::testing::TempDir() + "evcore_" + info->name() + ".ipc";
  }

  zmq::socket_t connectClient(const std::string& ep) {
    zmq::socket_t client(client_context, zmq::socket_type::req);
    client.set(zmq::sockopt::linger, 0);
    client.set(zmq::sockopt::rcvtimeo, 2000);
    client.connect(ep);
    return client;
  }

  static void send(zmq::socket_t& socket, const std::string& text) {
    zmq::message_t msg(text.data(), text.size());
    socket.send(msg, zmq::send_flags::none);
  }

  static std::string receive(zmq::socket_t& socket) {
    zmq::message_t msg;
    auto result = socket.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      return "<timeout>";
    }
    return std::string(static_cast<const char*>(msg.data()), msg.size());
  }
};

// -----------------------------------------------------------------------------
// 1. A queued command is served and answered by the handler.
// -----------------------------------------------------------------------------
TEST_F(ControlChannelTest, ServesOneCommandPerWait) {
  const std::string ep = endpoint();
  std::string seen;
  evcore::ControlChannel channel(
      [&seen](const std::string& cmd) {
        seen = cmd;
        return std::string("reply:") + cmd;
      },
      ep);
  channel.start();

  zmq::socket_t client = connectClient(ep);
  send(client, "PING");

  // The connection may take a moment; allow a few bounded waits.
  bool served = false;
  for (int i = 0; i < 20 && !served; ++i) {
    served = channel.waitForWork(100);
  }

  ASSERT_TRUE(served);
  EXPECT_EQ(seen, "PING");
  EXPECT_EQ(receive(client), "reply:PING");
  EXPECT_EQ(channel.commandsServed(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Without a command the wait times out and the hook decides the result.
// -----------------------------------------------------------------------------
TEST_F(ControlChannelTest, TimeoutFallsBackToHook) {
  int polls = 0;
  bool hook_result = false;
  evcore::ControlChannel channel(
      [](const std::string&) { return std::string(); }, endpoint(),
      [&]() {
        ++polls;
        return hook_result;
      },
      10);

  EXPECT_FALSE(channel.waitForWork(0));
  EXPECT_TRUE(channel.isStarted());
  EXPECT_EQ(polls, 2);  // before and after the receive

  hook_result = true;
  EXPECT_TRUE(channel.waitForWork(0));
  EXPECT_EQ(channel.commandsServed(), 0u);
}

// -----------------------------------------------------------------------------
// 3. A throwing handler is answered with an error reply, so the REP socket
//    is ready for the next request.
// -----------------------------------------------------------------------------
TEST_F(ControlChannelTest, FailingHandlerStillReplies) {
  const std::string ep = endpoint();
  evcore::ControlChannel channel(
      [](const std::string& cmd) -> std::string {
        if (cmd == "FAIL") {
          throw std::runtime_error("handler broke");
        }
        return "fine";
      },
      ep);
  channel.start();

  zmq::socket_t client = connectClient(ep);
  send(client, "FAIL");

  bool served = false;
  for (int i = 0; i < 20 && !served; ++i) {
    served = channel.waitForWork(100);
  }
  ASSERT_TRUE(served);

  auto r = nlohmann::json::parse(receive(client));
  EXPECT_EQ(r["status"], "error");
  EXPECT_NE(r["response"].get<std::string>().find("handler broke"),
            std::string::npos);

  send(client, "PING");
  served = false;
  for (int i = 0; i < 20 && !served; ++i) {
    served = channel.waitForWork(100);
  }
  ASSERT_TRUE(served);
  EXPECT_EQ(receive(client), "fine");
  EXPECT_EQ(channel.commandsServed(), 2u);
}

// -----------------------------------------------------------------------------
// 4. QUIT 9 over the socket makes run() return 9.
// -----------------------------------------------------------------------------
TEST_F(ControlChannelTest, QuitCommandStopsRunningLoop) {
  const std::string ep = endpoint();
  evcore::LiveTimeProvider clock;
  evcore::LoopCommandHandler* commands_ptr = nullptr;

  evcore::ControlChannel channel(
      [&commands_ptr](const std::string& cmd) {
        return commands_ptr->execute(cmd);
      },
      ep, {}, 20);
  evcore::EventLoop loop(clock, channel);
  evcore::LoopCommandHandler commands(loop);
  commands_ptr = &commands;

  // Upper bound so a lost command fails the test instead of hanging it.
  loop.singleShot(5000, [&loop]() { loop.requestQuit(-1); });

  channel.start();
  zmq::socket_t client = connectClient(ep);
  send(client, "QUIT 9");

  EXPECT_EQ(loop.run(), 9);
  EXPECT_NE(receive(client).find("\"ok\""), std::string::npos);
}

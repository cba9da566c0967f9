// -----------------------------------------------------------------------------
// evcore_demo - single executable entry point.
//
// Runs one EventLoop on the main thread and one of three scenarios picked by
// the "scenario" key of an optional JSON config file:
//
//   signals       Foo::start() is scheduled with singleShot(0). It emits
//                 signal1, finished and signal2 in that order. `finished` is
//                 connected to requestQuit(), yet signal2's slot and the
//                 "Bye!" line still run: quit is honoured only after the
//                 handler returns to the loop.
//   timers        A slow and a fast repeating timer delivered to a
//                 TimerHost, with an application-scope EventSpy filter that
//                 logs every Timer event first. Runs until Ctrl-C, a QUIT
//                 command, or run_for_ms.
//   custom-event  Registers a "Greeting" event type, posts one to a
//                 Receiver, which prints the payload and asks the loop to
//                 quit.
//
// Wake source:
//   control_endpoint empty  → SleepWakeSource (sleeps, polls SIGINT flag).
//   control_endpoint set    → ControlChannel (ZeroMQ REP; PING, STATUS,
//                             QUIT [code], POST <target> <type> [text]).
//
// Usage: evcore_demo [config.json]
// -----------------------------------------------------------------------------

#include "evcore/config/loop_config.hpp"
#include "evcore/engine/event_loop.hpp"
#include "evcore/engine/loop_command_handler.hpp"
#include "evcore/errors/dispatch_error.hpp"
#include "evcore/events/event.hpp"
#include "evcore/events/event_handler.hpp"
#include "evcore/network/control_channel.hpp"
#include "evcore/time/live_time_provider.hpp"
#include "evcore/wake/sleep_wake_source.hpp"

#include <zmq.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

// -----------------------------------------------------------------------------
// SIGINT flag.
// The handler only stores to a sig_atomic_t. The wake source's poll hook
// turns it into requestQuit(130) on the loop thread.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_sigint_received = 0;

static void sigint_handler(int /*signum*/) { g_sigint_received = 1; }

namespace {

constexpr int kSigintExitCode = 130;

// -----------------------------------------------------------------------------
// Foo - emitter of the signals scenario
// -----------------------------------------------------------------------------
class Foo {
 public:
  static constexpr const char* kSignal1 = "signal1";
  static constexpr const char* kSignal2 = "signal2";
  static constexpr const char* kFinished = "finished";

  explicit Foo(evcore::SignalBus& bus) : bus_(bus) {}

  void start() {
    doStuff();
    std::cout << "Bye!\n";
  }

 private:
  void doStuff() {
    std::cout << "Emit signal one\n";
    bus_.emit(this, kSignal1);

    std::cout << "Emit finished\n";
    bus_.emit(this, kFinished);

    std::cout << "Emit signal two\n";
    bus_.emit(this, kSignal2);
  }

  evcore::SignalBus& bus_;
};

// -----------------------------------------------------------------------------
// TimerHost - owns the slow/fast timers of the timers scenario
// -----------------------------------------------------------------------------
class TimerHost final : public evcore::IEventHandler {
 public:
  explicit TimerHost(evcore::EventLoop& loop) : loop_(loop) {}

  void arm(const std::shared_ptr<TimerHost>& self, std::int64_t slow_ms,
           std::int64_t fast_ms) {
    slow_id_ = loop_.startTimer(slow_ms, evcore::TimerMode::Repeating, self);
    fast_id_ = loop_.startTimer(fast_ms, evcore::TimerMode::Repeating, self);
  }

  bool handle(const evcore::Event& event) override {
    if (!event.is(evcore::BuiltinEventType::Timer)) {
      return false;
    }
    const auto* tick = event.payloadAs<evcore::TimerPayload>();
    if (tick == nullptr) {
      return false;
    }

    if (tick->timer_id == slow_id_) {
      std::cout << "[" << tick->fired_at_ms << " ms] (slow) timer slot\n";
    } else if (tick->timer_id == fast_id_) {
      std::cout << "[" << tick->fired_at_ms << " ms] (fast) timer slot\n";
    } else {
      return false;
    }
    return true;
  }

 private:
  evcore::EventLoop& loop_;
  evcore::TimerId slow_id_{0};
  evcore::TimerId fast_id_{0};
};

// -----------------------------------------------------------------------------
// Receiver - target of the custom-event scenario
// -----------------------------------------------------------------------------
class Receiver final : public evcore::IEventHandler {
 public:
  Receiver(evcore::EventLoop& loop, evcore::TypeId greeting)
      : loop_(loop), greeting_(greeting) {}

  bool handle(const evcore::Event& event) override {
    if (event.type() != greeting_) {
      return false;
    }
    const auto* text = event.payloadAs<std::string>();
    std::cout << "Received custom event with payload: "
              << (text != nullptr ? *text : std::string("<none>")) << "\n";
    if (quit_on_first_) {
      loop_.requestQuit(0);
    }
    return true;
  }

  // With a control channel the receiver stays up for further POSTs.
  void setQuitOnFirst(bool quit) { quit_on_first_ = quit; }

 private:
  evcore::EventLoop& loop_;
  evcore::TypeId greeting_;
  bool quit_on_first_{true};
};

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  evcore::LoopConfig config;
  if (argc > 1) {
    try {
      config = evcore::loadLoopConfig(argv[1]);
    } catch (const evcore::DispatchError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
  }

  std::cout << "[main] scenario=" << config.scenario << "\n";

  // -------------------------------------------------------------------------
  // 2) Clock, wake source and loop.
  // The hook needs the loop and the loop needs the wake source, so the hook
  // reaches the loop through a pointer that is set right after construction.
  // -------------------------------------------------------------------------
  evcore::LiveTimeProvider clock;
  evcore::EventLoop* loop_ptr = nullptr;

  evcore::PollHook sigint_hook = [&loop_ptr]() {
    if (g_sigint_received == 0 || loop_ptr == nullptr) {
      return false;
    }
    g_sigint_received = 0;
    std::cout << "\n[main] SIGINT received. Requesting quit...\n";
    loop_ptr->requestQuit(kSigintExitCode);
    return true;
  };

  std::unique_ptr<evcore::LoopCommandHandler> commands;
  std::unique_ptr<evcore::IWakeSource> wake_source;
  evcore::ControlChannel* control = nullptr;

  if (config.control_endpoint.empty()) {
    wake_source = std::make_unique<evcore::SleepWakeSource>(
        config.idle_slice_ms, sigint_hook);
  } else {
    auto channel = std::make_unique<evcore::ControlChannel>(
        [&commands](const std::string& cmd) {
          return commands->execute(cmd);
        },
        config.control_endpoint, sigint_hook, config.idle_slice_ms);
    control = channel.get();
    wake_source = std::move(channel);
  }

  evcore::LoopOptions options;
  options.trace_deliveries = config.trace_deliveries;

  evcore::EventLoop loop(clock, *wake_source, options);
  loop_ptr = &loop;
  commands = std::make_unique<evcore::LoopCommandHandler>(loop);

  loop.signalBus().connect(&loop, evcore::EventLoop::kAboutToQuit,
                           [](const evcore::SignalArgs&) {
                             std::cout << "[main] aboutToQuit\n";
                           });

  std::signal(SIGINT, sigint_handler);

  // -------------------------------------------------------------------------
  // 3) Scenario setup. Everything created here lives until main() returns.
  // -------------------------------------------------------------------------
  std::shared_ptr<Foo> foo;
  std::shared_ptr<TimerHost> timer_host;
  std::shared_ptr<Receiver> receiver;

  if (config.scenario == "signals") {
    // Connected through the owner, so the connections go away with foo.
    foo = std::make_shared<Foo>(loop.signalBus());
    Foo* f = foo.get();

    loop.signalBus().connect(foo, Foo::kSignal1,
                             [](const evcore::SignalArgs&) {
                               std::cout << "Execute slot one\n";
                             });
    loop.signalBus().connect(foo, Foo::kSignal2,
                             [](const evcore::SignalArgs&) {
                               std::cout << "Execute slot two\n";
                             });
    loop.signalBus().connect(foo, Foo::kFinished,
                             [&loop](const evcore::SignalArgs&) {
                               loop.requestQuit(0);
                             });

    loop.singleShot(0, [f]() { f->start(); });
  } else if (config.scenario == "timers") {
    loop.installEventFilter(
        evcore::FilterScope::application(),
        [&loop](const evcore::Event& event) {
          if (event.is(evcore::BuiltinEventType::Timer)) {
            std::cout << "[EventSpy] t=" << loop.now_ms() << " Event="
                      << loop.eventTypes().nameOf(event.type()) << " #"
                      << event.sequenceId() << "\n";
          }
          return evcore::FilterResult::Pass;
        });

    timer_host = std::make_shared<TimerHost>(loop);
    timer_host->arm(timer_host, config.slow_timer_ms, config.fast_timer_ms);
    commands->registerTarget("timers", timer_host);
  } else if (config.scenario == "custom-event") {
    const evcore::TypeId greeting = loop.registerEventType("Greeting");
    receiver = std::make_shared<Receiver>(loop, greeting);
    receiver->setQuitOnFirst(control == nullptr);
    commands->registerTarget("receiver", receiver);

    loop.post(receiver, greeting, std::string("hello from custom event"));
  } else {
    std::cerr << "[main] unknown scenario '" << config.scenario << "'\n";
    return 1;
  }

  if (config.run_for_ms > 0) {
    loop.singleShot(config.run_for_ms, [&loop]() { loop.requestQuit(0); });
  }

  if (control != nullptr) {
    try {
      control->start();
    } catch (const zmq::error_t& e) {
      std::cerr << "[main] cannot bind " << config.control_endpoint << ": "
                << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] Send PING / STATUS / QUIT with a ZeroMQ REQ client.\n";
  }
  std::cout << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Run. A handler fault is reported and turned into exit code 1.
  // -------------------------------------------------------------------------
  int exit_code = 0;
  try {
    exit_code = loop.run();
  } catch (const std::exception& e) {
    std::cerr << "[main] loop failed: " << e.what() << "\n";
    exit_code = 1;
  }

  const evcore::LoopStats& stats = loop.stats();
  std::cout << "[main] delivered=" << stats.delivered
            << " filtered=" << stats.filtered << " dropped=" << stats.dropped
            << " timer_events=" << stats.timer_events << "\n";

  loop_ptr = nullptr;
  return exit_code;
}

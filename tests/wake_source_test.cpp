// =============================================================================
// wake_source_test.cpp
// =============================================================================
// Unit tests for the IWakeSource implementations and the time providers.
//
// Validates:
//   - SimulatedWakeSource jumps to scheduled stimuli, otherwise advances the
//     clock by the timeout, and reports a stall when it would block forever
//   - SleepWakeSource returns as soon as its hook reports work
//   - SimulationTimeProvider only moves forward
// =============================================================================

#include "evcore/errors/dispatch_error.hpp"
#include "evcore/time/live_time_provider.hpp"
#include "evcore/time/simulation_time_provider.hpp"
#include "evcore/wake/simulated_wake_source.hpp"
#include "evcore/wake/sleep_wake_source.hpp"

#include <gtest/gtest.h>

#include <vector>

// -----------------------------------------------------------------------------
// 1. A stimulus inside the wait window is run at its own timestamp.
// -----------------------------------------------------------------------------
TEST(SimulatedWakeSourceTest, RunsStimulusInsideWindow) {
  evcore::SimulationTimeProvider clock;
  evcore::SimulatedWakeSource wake(clock);
  std::vector<int> ran;
  wake.schedule(50, [&ran]() { ran.push_back(50); });

  EXPECT_TRUE(wake.waitForWork(100));
  EXPECT_EQ(clock.now_ms(), 50);
  EXPECT_EQ(ran.size(), 1u);
  EXPECT_EQ(wake.pendingStimuli(), 0u);
}

// -----------------------------------------------------------------------------
// 2. A stimulus outside the window waits; the clock advances by the timeout.
// -----------------------------------------------------------------------------
TEST(SimulatedWakeSourceTest, AdvancesByTimeoutWhenNothingIsDue) {
  evcore::SimulationTimeProvider clock;
  evcore::SimulatedWakeSource wake(clock);
  wake.schedule(500, []() {});

  EXPECT_FALSE(wake.waitForWork(100));
  EXPECT_EQ(clock.now_ms(), 100);
  EXPECT_EQ(wake.pendingStimuli(), 1u);
  EXPECT_EQ(wake.waitCount(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Stimuli at the same instant run together, in schedule order. Stimuli
//    they schedule are left for a later wait.
// -----------------------------------------------------------------------------
TEST(SimulatedWakeSourceTest, SameInstantBatchRunsInOrder) {
  evcore::SimulationTimeProvider clock;
  evcore::SimulatedWakeSource wake(clock);
  std::vector<int> ran;
  wake.schedule(10, [&]() {
    ran.push_back(1);
    wake.schedule(10, [&ran]() { ran.push_back(3); });
  });
  wake.schedule(10, [&ran]() { ran.push_back(2); });

  EXPECT_TRUE(wake.waitForWork(-1));
  std::vector<int> first{1, 2};
  EXPECT_EQ(ran, first);

  EXPECT_TRUE(wake.waitForWork(0));
  std::vector<int> second{1, 2, 3};
  EXPECT_EQ(ran, second);
}

// -----------------------------------------------------------------------------
// 4. An unbounded wait with nothing scheduled is a stall.
// -----------------------------------------------------------------------------
TEST(SimulatedWakeSourceTest, UnboundedWaitWithoutStimuliThrows) {
  evcore::SimulationTimeProvider clock;
  evcore::SimulatedWakeSource wake(clock);
  try {
    wake.waitForWork(-1);
    FAIL() << "expected DispatchError";
  } catch (const evcore::DispatchError& e) {
    EXPECT_EQ(e.kind(), evcore::ErrorKind::LoopStalled);
  }
}

// -----------------------------------------------------------------------------
// 5. SleepWakeSource returns immediately when the hook reports work, and a
//    zero timeout never sleeps.
// -----------------------------------------------------------------------------
TEST(SleepWakeSourceTest, HookShortCircuitsTheWait) {
  int polls = 0;
  evcore::SleepWakeSource wake(10, [&polls]() {
    ++polls;
    return true;
  });
  EXPECT_TRUE(wake.waitForWork(60000));
  EXPECT_EQ(polls, 1);

  evcore::SleepWakeSource idle(10);
  EXPECT_FALSE(idle.waitForWork(0));
}

// -----------------------------------------------------------------------------
// 6. Simulation time only moves forward.
// -----------------------------------------------------------------------------
TEST(SimulationTimeProviderTest, OnlyMovesForward) {
  evcore::SimulationTimeProvider clock(100);
  EXPECT_TRUE(clock.advance_time(150));
  EXPECT_FALSE(clock.advance_time(120));
  EXPECT_EQ(clock.now_ms(), 150);

  clock.advance_by(-10);
  EXPECT_EQ(clock.now_ms(), 150);
  clock.advance_by(25);
  EXPECT_EQ(clock.now_ms(), 175);
}

// -----------------------------------------------------------------------------
// 7. Live time starts near zero and never goes backwards.
// -----------------------------------------------------------------------------
TEST(LiveTimeProviderTest, IsMonotonic) {
  evcore::LiveTimeProvider clock;
  const auto first = clock.now_ms();
  const auto second = clock.now_ms();
  EXPECT_GE(first, 0);
  EXPECT_GE(second, first);
}

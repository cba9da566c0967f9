#pragma once

#include "evcore/wake/i_wake_source.hpp"

#include <cstdint>
#include <utility>

namespace evcore {

// -----------------------------------------------------------------------------
// SleepWakeSource
// -----------------------------------------------------------------------------
// Responsibility: Default wake source for a live application. Sleeps the
// calling thread for the requested timeout, in slices of at most slice_ms,
// and calls the poll hook after every slice so an external stop request
// (SIGINT flag) is noticed within one slice.
//
// A negative timeout (no timers armed) sleeps a single slice and returns, so
// the loop re-evaluates its state at least every slice_ms.
// -----------------------------------------------------------------------------
class SleepWakeSource final : public IWakeSource {
 public:
  static constexpr std::int64_t kDefaultSliceMs = 100;

  explicit SleepWakeSource(std::int64_t slice_ms = kDefaultSliceMs,
                           PollHook hook = {});

  bool waitForWork(std::int64_t timeout_ms) override;

  void setHook(PollHook hook) { hook_ = std::move(hook); }

 private:
  bool poll();

  std::int64_t slice_ms_;
  PollHook hook_;
};

}  // namespace evcore

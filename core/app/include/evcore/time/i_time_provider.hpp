#pragma once

#include <cstdint>

namespace evcore {

// -----------------------------------------------------------------------------
// ITimeProvider - abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "now" for the loop and its timer registry.
//
// @details
// Timer deadlines are computed from now_ms(), never from a clock read inside
// the registry. Injecting the source keeps the loop deterministic in tests:
//   - LiveTimeProvider       → monotonic steady clock.
//   - SimulationTimeProvider → a value the test (or a SimulatedWakeSource)
//                              advances explicitly.
//
// Values are milliseconds from an arbitrary, fixed origin. Only differences
// are meaningful; implementations must never go backwards.
//
// Ownership:
//   The loop holds a const reference; the provider must outlive the loop.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @return Current time in milliseconds.
  //
  // Side-effects: None. A pure read.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace evcore

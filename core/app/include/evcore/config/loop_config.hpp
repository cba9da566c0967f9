#pragma once

#include <cstdint>
#include <string>

namespace evcore {

// -----------------------------------------------------------------------------
// LoopConfig - settings for the demo host and its loop
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct filled from a JSON document. Every field has a
//         default, so an empty object (or no file at all) is a valid config.
//
// @details
// Example:
//   {
//     "scenario":          "timers",       // "signals" | "timers" | "custom-event"
//     "trace_deliveries":  false,          // log every delivery on stdout
//     "idle_slice_ms":     100,            // SleepWakeSource slice
//     "control_endpoint":  "tcp://127.0.0.1:5560",  // "" disables ZeroMQ
//     "slow_timer_ms":     1000,
//     "fast_timer_ms":     250,
//     "run_for_ms":        0               // 0 = until quit / Ctrl-C
//   }
//
// Unknown keys are ignored. A present key with the wrong JSON type, or a
// negative duration, is a DispatchError(ConfigError).
// -----------------------------------------------------------------------------
struct LoopConfig {
  std::string scenario{"signals"};
  bool trace_deliveries{false};
  std::int64_t idle_slice_ms{100};
  std::string control_endpoint;
  std::int64_t slow_timer_ms{1000};
  std::int64_t fast_timer_ms{250};
  std::int64_t run_for_ms{0};
};

// Parses a JSON document. Throws DispatchError(ConfigError) on malformed
// JSON, wrong types or out-of-range values.
LoopConfig parseLoopConfig(const std::string& json_text);

// Reads and parses a file. Throws DispatchError(ConfigError) if the file
// cannot be opened, in addition to the parse errors above.
LoopConfig loadLoopConfig(const std::string& path);

}  // namespace evcore

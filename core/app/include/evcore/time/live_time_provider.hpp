#pragma once

#include "evcore/time/i_time_provider.hpp"

#include <chrono>

namespace evcore {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall-clock time for a running application
// -----------------------------------------------------------------------------
//
// @brief  Milliseconds on std::chrono::steady_clock, measured from the moment
//         the provider was constructed.
//
// @details
// steady_clock rather than system_clock: timer deadlines must not jump when
// the system time is adjusted (NTP, manual changes). Starting at 0 keeps
// logged timestamps small and readable.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  LiveTimeProvider() : origin_(std::chrono::steady_clock::now()) {}

  std::int64_t now_ms() const override;

 private:
  std::chrono::steady_clock::time_point origin_;
};

}  // namespace evcore

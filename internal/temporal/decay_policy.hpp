#pragma once

#include <chrono>

#include "internal/util/time.hpp"

namespace digest::runtime::config {
class TemporalDecayConfig;
}

namespace digest::temporal {

/*
  Time-window thresholds for temporal decay.
*/
struct DecayPolicy {
  // Expired events stay visible for this long past their end.
  util::Clock::duration grace_period{std::chrono::hours(1)};
  // An event counts as happening now from this long before its start.
  util::Clock::duration active_window{std::chrono::hours(1)};
  util::Clock::duration upcoming_horizon{std::chrono::hours(24 * 7)};
  util::Clock::duration delivery_stale_after{std::chrono::hours(24)};

  // Unset or non-positive config values keep the defaults above.
  static DecayPolicy FromConfig(const digest::runtime::config::TemporalDecayConfig& config);
};

} // namespace digest::temporal

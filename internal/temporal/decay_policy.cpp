#include "decay_policy.hpp"

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace digest::temporal {

namespace {

using Hours = std::chrono::duration<double, std::ratio<3600>>;

void Apply(const char* name, bool present, double value, double hours_per_unit, util::Clock::duration* target) {
  if (!present) return;
  if (value <= 0) {
    DIGEST_LOG_WARN("Ignoring non-positive temporal_decay setting", {observability::StringField("setting", name), observability::DoubleField("value", value)});
    return;
  }
  *target = std::chrono::duration_cast<util::Clock::duration>(Hours(value * hours_per_unit));
}

} // namespace

DecayPolicy DecayPolicy::FromConfig(const digest::runtime::config::TemporalDecayConfig& config) {
  DecayPolicy policy;
  Apply("grace_period_hours", config.has_grace_period_hours(), config.grace_period_hours(), 1, &policy.grace_period);
  Apply("active_window_hours", config.has_active_window_hours(), config.active_window_hours(), 1, &policy.active_window);
  Apply("upcoming_horizon_days", config.has_upcoming_horizon_days(), config.upcoming_horizon_days(), 24, &policy.upcoming_horizon);
  Apply("delivery_stale_hours", config.has_delivery_stale_hours(), config.delivery_stale_hours(), 1, &policy.delivery_stale_after);
  return policy;
}

} // namespace digest::temporal

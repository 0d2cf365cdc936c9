#include "temporal_resolver.hpp"

namespace digest::temporal {

using model::DecayReason;
using model::EntityType;
using model::Importance;

namespace {

bool IsTemporalType(EntityType type) {
  return type == EntityType::kEvent || type == EntityType::kDeadline || type == EntityType::kNotification;
}

bool IsHideableType(EntityType type) {
  return type == EntityType::kEvent || type == EntityType::kDeadline;
}

TemporalDecayResult Unchanged(Importance stored, DecayReason reason) {
  return {stored, reason, false, std::nullopt};
}

TemporalDecayResult Forced(Importance stored, Importance resolved, DecayReason reason) {
  return {resolved, reason, stored != resolved, std::nullopt};
}

} // namespace

TemporalDecayResolver::TemporalDecayResolver(DecayPolicy policy) : policy_(policy) {
}

TemporalDecayResult TemporalDecayResolver::Resolve(EntityType type, Importance stored, std::optional<util::TimePoint> temporal_start,
                                                   std::optional<util::TimePoint> temporal_end, util::TimePoint now) const {
  if (!IsTemporalType(type)) {
    return Unchanged(stored, DecayReason::kNonTemporalType);
  }

  if (!temporal_start) {
    return Unchanged(stored, DecayReason::kNoTemporalData);
  }

  const auto start      = *temporal_start;
  const auto expiration = temporal_end.value_or(start);

  // Expired beats everything, including an upstream critical.
  if (expiration + policy_.grace_period < now) {
    auto result       = Forced(stored, Importance::kRoutine, DecayReason::kTemporalExpired);
    result.decayed_at = now;
    return result;
  }

  if (start - policy_.active_window <= now && now <= expiration + policy_.active_window) {
    return Forced(stored, Importance::kCritical, DecayReason::kTemporalActive);
  }

  if (start - now <= policy_.upcoming_horizon) {
    if (stored == Importance::kCritical) {
      return Unchanged(stored, DecayReason::kTemporalUpcoming);
    }
    return Forced(stored, Importance::kTimeSensitive, DecayReason::kTemporalUpcoming);
  }

  // Distant: trust an upstream critical (e.g. a cancellation notice).
  if (stored == Importance::kCritical) {
    return Unchanged(stored, DecayReason::kTemporalDistantButCritical);
  }
  return Forced(stored, Importance::kRoutine, DecayReason::kTemporalDistant);
}

std::optional<TemporalDecayResult> TemporalDecayResolver::ResolveDelivery(const DeliverySignals& signals, Importance stored, util::TimePoint now) const {
  if (!signals.present) {
    return std::nullopt;
  }

  if (signals.otp_expires_at && now < *signals.otp_expires_at) {
    return Forced(stored, Importance::kCritical, DecayReason::kOtpActive);
  }

  if (signals.ship_status == "out_for_delivery") {
    return Forced(stored, Importance::kCritical, DecayReason::kDeliveryActive);
  }

  if (signals.ship_status == "delivered" && signals.delivered_at && now - *signals.delivered_at > policy_.delivery_stale_after) {
    return Forced(stored, Importance::kRoutine, DecayReason::kDeliveryStale);
  }

  // processing / in_transit / recently delivered
  return std::nullopt;
}

TemporalDecayResult TemporalDecayResolver::ResolveFields(EntityType type, Importance stored, const TemporalFields& fields, util::TimePoint now) const {
  if (type == EntityType::kNotification) {
    if (!fields.delivery.present) {
      return Unchanged(stored, DecayReason::kNonTemporalType);
    }
    if (auto overlay = ResolveDelivery(fields.delivery, stored, now)) {
      return *overlay;
    }
  }

  return Resolve(type, stored, fields.window.start, fields.window.end, now);
}

bool TemporalDecayResolver::IsExpired(const TemporalWindow& window, util::TimePoint now) const {
  if (!window.start) {
    return false;
  }
  return window.end.value_or(*window.start) + policy_.grace_period < now;
}

bool TemporalDecayResolver::ShouldHide(EntityType type, Importance resolved, const TemporalWindow& window, util::TimePoint now) const {
  if (!IsHideableType(type)) {
    return false;
  }
  return resolved == Importance::kRoutine && IsExpired(window, now);
}

} // namespace digest::temporal

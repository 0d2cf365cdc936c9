#pragma once

#include <optional>

#include "decay_policy.hpp"
#include "temporal_fields.hpp"
#include "internal/model/decay_reason.hpp"
#include "internal/model/entity.hpp"
#include "internal/model/importance.hpp"

namespace digest::temporal {

struct TemporalDecayResult {
  model::Importance              resolved_importance{model::Importance::kRoutine};
  model::DecayReason             decay_reason{model::DecayReason::kNoTemporalData};
  bool                           was_modified{false};
  std::optional<util::TimePoint> decayed_at;
};

/*
  Deterministic temporal decay. Every method is pure.

  Decision table, first match wins:
    non-temporal type        -> unchanged
    no start time            -> unchanged
    (end|start)+grace < now  -> routine      (expired, hidden when event/deadline)
    start-window <= now <= (end|start)+window -> critical
    start-now <= horizon     -> time_sensitive, critical preserved
    otherwise                -> routine, critical preserved
*/
class TemporalDecayResolver {
 public:
  explicit TemporalDecayResolver(DecayPolicy policy = {});

  // Events, deadlines and notifications are temporal; everything else passes through.
  TemporalDecayResult Resolve(model::EntityType type, model::Importance stored, std::optional<util::TimePoint> temporal_start,
                              std::optional<util::TimePoint> temporal_end, util::TimePoint now) const;

  // OTP / shipping overlay. nullopt means fall through to Resolve.
  std::optional<TemporalDecayResult> ResolveDelivery(const DeliverySignals& signals, model::Importance stored, util::TimePoint now) const;

  // Overlay first for notifications, then the table. Notifications without
  // OTP or shipping fields are non-temporal.
  TemporalDecayResult ResolveFields(model::EntityType type, model::Importance stored, const TemporalFields& fields, util::TimePoint now) const;

  bool IsExpired(const TemporalWindow& window, util::TimePoint now) const;

  // Only events and deadlines are ever hidden.
  bool ShouldHide(model::EntityType type, model::Importance resolved, const TemporalWindow& window, util::TimePoint now) const;

  const DecayPolicy& Policy() const {
    return policy_;
  }

 private:
  DecayPolicy policy_;
};

} // namespace digest::temporal

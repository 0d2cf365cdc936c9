#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/entity.hpp"
#include "internal/util/result.hpp"
#include "internal/util/time.hpp"

namespace digest::temporal {

struct TemporalWindow {
  std::optional<util::TimePoint> start;
  std::optional<util::TimePoint> end;
};

// OTP and shipping state carried by notification entities.
struct DeliverySignals {
  bool                           present{false};
  std::optional<util::TimePoint> otp_expires_at;
  std::string                    ship_status;
  std::optional<util::TimePoint> delivered_at;
};

struct TemporalFields {
  TemporalWindow  window;
  DeliverySignals delivery;

  // One message per malformed timestamp field.
  std::vector<std::string> parse_errors;
};

/*
  Event: event_time / event_end_time. Deadline: due_date (no end).
  Notification: OTP expiry and shipping state. Other kinds carry nothing.
*/
util::Result<TemporalWindow> ExtractTemporalWindow(const model::Entity& entity);
DeliverySignals               ExtractDeliverySignals(const model::NotificationDetails& details, std::vector<std::string>* parse_errors);

// Malformed window timestamps leave the window empty; malformed delivery
// timestamps drop only that field. Every failure lands in parse_errors.
TemporalFields ExtractTemporalFields(const model::Entity& entity);

} // namespace digest::temporal

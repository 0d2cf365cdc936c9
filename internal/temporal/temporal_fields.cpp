#include "temporal_fields.hpp"

namespace digest::temporal {

namespace {

using WindowResult = util::Result<TemporalWindow>;

util::Result<std::optional<util::TimePoint>> ParseOptional(const char* field, const std::optional<std::string>& raw) {
  using OptionalResult = util::Result<std::optional<util::TimePoint>>;
  if (!raw || raw->empty()) {
    return OptionalResult::Ok(std::nullopt);
  }

  auto parsed = util::ParseTimestamp(*raw);
  if (!parsed) {
    return OptionalResult::Err(parsed.code, std::string(field) + ": " + parsed.message);
  }
  return OptionalResult::Ok(parsed.value);
}

WindowResult WindowFrom(const char* start_field, const std::optional<std::string>& start_raw, const char* end_field,
                        const std::optional<std::string>& end_raw) {
  auto start = ParseOptional(start_field, start_raw);
  if (!start) {
    return WindowResult::Err(start.code, start.message);
  }
  if (!start.value) {
    // without a start the end is meaningless
    return WindowResult::Ok({});
  }

  auto end = ParseOptional(end_field, end_raw);
  if (!end) {
    return WindowResult::Err(end.code, end.message);
  }
  return WindowResult::Ok({start.value, end.value});
}

} // namespace

util::Result<TemporalWindow> ExtractTemporalWindow(const model::Entity& entity) {
  static const std::optional<std::string> kNone;

  return std::visit(model::Overloaded{
                        [](const model::EventDetails& event) { return WindowFrom("event_time", event.event_time, "event_end_time", event.event_end_time); },
                        [](const model::DeadlineDetails& deadline) { return WindowFrom("due_date", deadline.due_date, "", kNone); },
                        [](const model::FlightDetails&) { return WindowResult::Ok({}); },
                        [](const model::ReminderDetails&) { return WindowResult::Ok({}); },
                        [](const model::PromoDetails&) { return WindowResult::Ok({}); },
                        [](const model::NotificationDetails&) { return WindowResult::Ok({}); },
                        [](const model::GenericDetails&) { return WindowResult::Ok({}); },
                    },
                    entity.details);
}

DeliverySignals ExtractDeliverySignals(const model::NotificationDetails& details, std::vector<std::string>* parse_errors) {
  DeliverySignals signals;
  signals.present     = details.HasDeliverySignals();
  signals.ship_status = details.ship_status.value_or("");

  auto otp = ParseOptional("otp_expires_at", details.otp_expires_at);
  if (otp) {
    signals.otp_expires_at = otp.value;
  } else if (parse_errors) {
    parse_errors->push_back(otp.message);
  }

  auto delivered = ParseOptional("delivered_at", details.delivered_at);
  if (delivered) {
    signals.delivered_at = delivered.value;
  } else if (parse_errors) {
    parse_errors->push_back(delivered.message);
  }

  return signals;
}

TemporalFields ExtractTemporalFields(const model::Entity& entity) {
  TemporalFields fields;

  auto window = ExtractTemporalWindow(entity);
  if (window) {
    fields.window = window.value;
  } else {
    fields.parse_errors.push_back(window.message);
  }

  if (const auto* notification = std::get_if<model::NotificationDetails>(&entity.details)) {
    fields.delivery = ExtractDeliverySignals(*notification, &fields.parse_errors);
  }

  return fields;
}

} // namespace digest::temporal

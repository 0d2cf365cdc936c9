#include "entity.hpp"

namespace digest::model {

std::string_view ToString(EntityType type) {
  switch (type) {
    case EntityType::kFlight:
      return "flight";
    case EntityType::kEvent:
      return "event";
    case EntityType::kDeadline:
      return "deadline";
    case EntityType::kReminder:
      return "reminder";
    case EntityType::kPromo:
      return "promo";
    case EntityType::kNotification:
      return "notification";
    case EntityType::kReceipt:
      return "receipt";
    case EntityType::kNewsletter:
      return "newsletter";
    case EntityType::kUnknown:
    default:
      return "unknown";
  }
}

std::optional<EntityType> ParseEntityType(std::string_view value) {
  if (value == "flight") return EntityType::kFlight;
  if (value == "event") return EntityType::kEvent;
  if (value == "deadline") return EntityType::kDeadline;
  if (value == "reminder") return EntityType::kReminder;
  if (value == "promo") return EntityType::kPromo;
  if (value == "notification") return EntityType::kNotification;
  if (value == "receipt") return EntityType::kReceipt;
  if (value == "newsletter") return EntityType::kNewsletter;
  if (value == "unknown") return EntityType::kUnknown;
  return std::nullopt;
}

EntityType Entity::Type() const {
  return std::visit(Overloaded{
                        [](const FlightDetails&) { return EntityType::kFlight; },
                        [](const EventDetails&) { return EntityType::kEvent; },
                        [](const DeadlineDetails&) { return EntityType::kDeadline; },
                        [](const ReminderDetails&) { return EntityType::kReminder; },
                        [](const PromoDetails&) { return EntityType::kPromo; },
                        [](const NotificationDetails&) { return EntityType::kNotification; },
                        [](const GenericDetails& generic) { return generic.type; },
                    },
                    details);
}

} // namespace digest::model

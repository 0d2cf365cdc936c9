#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/model/decay_reason.hpp"
#include "internal/model/importance.hpp"
#include "internal/util/time.hpp"

namespace digest::model {

enum class EntityType : std::uint8_t {
  kUnknown      = 0,
  kFlight       = 1,
  kEvent        = 2,
  kDeadline     = 3,
  kReminder     = 4,
  kPromo        = 5,
  kNotification = 6,
  kReceipt      = 7,
  kNewsletter   = 8,
};

std::string_view          ToString(EntityType type);
std::optional<EntityType> ParseEntityType(std::string_view value);

/*
  Subtype details. Temporal fields are raw ISO-8601 text as produced by the
  extractor; they are parsed during enrichment.
*/

struct FlightDetails {
  std::optional<std::string> airline;
  std::optional<std::string> flight_number;
  std::optional<std::string> departure_time;
  std::optional<std::string> confirmation_code;
};

struct EventDetails {
  std::optional<std::string> title;
  std::optional<std::string> event_time;
  std::optional<std::string> event_end_time;
  std::optional<std::string> location;
  std::optional<std::string> organizer;
};

struct DeadlineDetails {
  std::optional<std::string> title;
  std::optional<std::string> due_date;
  std::optional<std::string> amount;
  std::optional<std::string> from_whom;
};

struct ReminderDetails {
  std::optional<std::string> from_sender;
  std::optional<std::string> action;
  std::optional<std::string> deadline;
};

struct PromoDetails {
  std::optional<std::string> merchant;
  std::optional<std::string> offer;
  std::optional<std::string> expiry;
  std::optional<std::string> product_category;
};

struct NotificationDetails {
  std::optional<std::string> category;
  std::optional<std::string> message;
  bool                       action_required{false};

  std::optional<std::string> otp_expires_at;
  std::optional<std::string> ship_status; // processing | in_transit | out_for_delivery | delivered
  std::optional<std::string> delivered_at;
  std::optional<std::string> tracking_number;

  bool HasDeliverySignals() const {
    return otp_expires_at.has_value() || ship_status.has_value() || delivered_at.has_value();
  }
};

// Entity kinds without subtype fields: receipt, newsletter, unknown.
struct GenericDetails {
  EntityType type{EntityType::kUnknown};
};

using EntityDetails =
    std::variant<FlightDetails, EventDetails, DeadlineDetails, ReminderDetails, PromoDetails, NotificationDetails, GenericDetails>;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

struct Entity {
  double                          confidence{0.0};
  std::string                     source_email_id;
  std::string                     source_thread_id;
  std::string                     source_subject;
  std::string                     source_snippet;
  std::optional<util::TimePoint>  timestamp;
  std::optional<Importance>       importance; // as stored by the upstream model
  EntityDetails                   details{GenericDetails{}};

  // Audit fields, populated once by enrichment.
  std::optional<Importance>    stored_importance;
  std::optional<Importance>    resolved_importance;
  std::optional<DecayReason>   decay_reason;
  bool                         was_modified{false};
  std::optional<DigestSection> digest_section;
  bool                         hide_in_digest{false};

  EntityType Type() const;

  bool IsEnriched() const {
    return resolved_importance.has_value();
  }
};

} // namespace digest::model

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/entity.hpp"

namespace digest::dedup {

inline constexpr std::size_t kDefaultEmailIdPrefixLength = 20;

// Lower-cased, trimmed; absent values become "".
std::string NormalizePart(std::string_view value);
std::string NormalizePart(const std::optional<std::string>& value);

// Strips delivery/status/action phrases from a notification subject. Falls
// back to the plain normalized subject when almost nothing is left.
std::string NormalizeNotificationSubject(std::string_view subject);

/*
  Type-specific identity of the real-world thing an entity refers to:

    flight        flight_<airline>_<flight_number>_<departure_time>
    event         event_<title>_<event_time>
    deadline      deadline_<title>_<due_date>_<from_whom>
    promo         promo_<merchant>_<offer>
    notification  notification_<category>_<email_id prefix>_<normalized subject>
    other         <type>_<source_subject>
*/
std::string GenerateSignature(const model::Entity& entity, std::size_t email_id_prefix_length = kDefaultEmailIdPrefixLength);

} // namespace digest::dedup

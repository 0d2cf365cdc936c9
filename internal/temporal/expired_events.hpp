#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/email.hpp"
#include "internal/util/time.hpp"

namespace digest::temporal {

/*
  Email-level filter for events that already happened. Runs before any
  importance is assigned; a dropped email takes its entities with it.

  An email is expired when any of these holds, checked in order:
    - its type is event/calendar and temporal_start < now - 1h
    - it is a calendar reply ("Accepted:", "Declined:") whose
      "@ Tue Nov 18, 2025" date is before now - 2h
    - it says "starts in N hours|days|minutes" and date + N is before now
    - it is a "Notification:" whose "@ <date>" is before now - 2h

  A send date that cannot be parsed keeps the email. Dates without an
  offset are UTC.
*/
bool IsExpiredEvent(const model::EmailRecord& email, util::TimePoint now);

// Keeps input order. Ids of dropped emails are appended to expired_ids.
std::vector<model::EmailRecord> FilterExpiredEvents(std::vector<model::EmailRecord> emails, util::TimePoint now,
                                                    std::vector<std::string>* expired_ids = nullptr);

// "@ Fri Oct 31, 2025 2pm" -> 2025-10-31T14:00. Without a year, default_year is used.
std::optional<util::TimePoint> ExtractCalendarDate(std::string_view subject, int default_year);

// "starts in 1 hour" relative to sent_at.
std::optional<util::TimePoint> ExtractRelativeStart(std::string_view text, util::TimePoint sent_at);

} // namespace digest::temporal

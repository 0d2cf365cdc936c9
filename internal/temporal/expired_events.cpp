#include "expired_events.hpp"

#include <chrono>
#include <regex>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace digest::temporal {

using digest::observability::StringField;

namespace {

// An event-typed email is gone this long after its start.
constexpr auto kEventStartGrace = std::chrono::hours(1);
// Same-day buffer for dates read out of a subject line.
constexpr auto kSubjectDateBuffer = std::chrono::hours(2);

bool Contains(const std::string& haystack, std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}

int YearOf(util::TimePoint tp) {
  return std::stoi(util::FormatTimestamp(tp).substr(0, 4));
}

bool StartedLongAgo(const model::EmailRecord& email, util::TimePoint now) {
  if (email.type != "event" && email.type != "calendar") return false;
  if (!email.temporal_start || email.temporal_start->empty()) return false;

  auto start = util::ParseTimestamp(*email.temporal_start);
  return start && start.value < now - kEventStartGrace;
}

} // namespace

std::optional<util::TimePoint> ExtractCalendarDate(std::string_view subject, int default_year) {
  static const std::regex kCalendarDate(R"(@\s+(?:mon|tue|wed|thu|fri|sat|sun)\s+(\w+)\s+(\d+)(?:,?\s+(\d{4}))?(?:\s+(\d+)([ap]m))?)",
                                        std::regex::ECMAScript | std::regex::icase);

  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(subject.begin(), subject.end(), match, kCalendarDate)) {
    return std::nullopt;
  }

  const int month = util::MonthFromName(match.str(1));
  if (month == 0 || match.length(2) > 2) {
    return std::nullopt;
  }
  const int day  = std::stoi(match.str(2));
  const int year = match[3].matched ? std::stoi(match.str(3)) : default_year;

  int hour = 0;
  if (match[4].matched) {
    if (match.length(4) > 2) return std::nullopt;
    hour                = std::stoi(match.str(4));
    const auto meridiem = util::ToLower(match.str(5));
    if (meridiem == "pm" && hour != 12) {
      hour += 12;
    } else if (meridiem == "am" && hour == 12) {
      hour = 0;
    }
  }

  auto date = util::TimePointFromCivil(year, month, day, hour);
  if (!date) {
    return std::nullopt;
  }
  return date.value;
}

std::optional<util::TimePoint> ExtractRelativeStart(std::string_view text, util::TimePoint sent_at) {
  static const std::regex kHours(R"(starts in (\d{1,4})\s*(hour|hr)s?)", std::regex::ECMAScript | std::regex::icase);
  static const std::regex kDays(R"(starts in (\d{1,4})\s*days?)", std::regex::ECMAScript | std::regex::icase);
  static const std::regex kMinutes(R"(starts in (\d{1,4})\s*(minute|min)s?)", std::regex::ECMAScript | std::regex::icase);

  std::match_results<std::string_view::const_iterator> match;
  if (std::regex_search(text.begin(), text.end(), match, kHours)) {
    return sent_at + std::chrono::hours(std::stoi(match.str(1)));
  }
  if (std::regex_search(text.begin(), text.end(), match, kDays)) {
    return sent_at + std::chrono::hours(24 * std::stoi(match.str(1)));
  }
  if (std::regex_search(text.begin(), text.end(), match, kMinutes)) {
    return sent_at + std::chrono::minutes(std::stoi(match.str(1)));
  }
  return std::nullopt;
}

bool IsExpiredEvent(const model::EmailRecord& email, util::TimePoint now) {
  if (StartedLongAgo(email, now)) {
    return true;
  }

  std::optional<util::TimePoint> sent_at;
  if (email.date && !email.date->empty()) {
    auto parsed = util::ParseMailDate(*email.date);
    if (!parsed) {
      DIGEST_LOG_WARN("Unparseable email date, keeping email", {StringField("email_id", email.id), StringField("error", parsed.message)});
      return false;
    }
    sent_at = parsed.value;
  }

  const auto subject = util::ToLower(email.subject);
  const auto snippet = util::ToLower(email.snippet);

  if (Contains(subject, "accepted:") || Contains(subject, "declined:") || Contains(snippet, "you accepted") || Contains(snippet, "you declined")) {
    auto event_date = ExtractCalendarDate(email.subject, YearOf(now));
    if (event_date && *event_date < now - kSubjectDateBuffer) {
      return true;
    }
  }

  if (sent_at && (Contains(subject, "starts in") || Contains(subject, "don't forget") || Contains(snippet, "starts in"))) {
    auto starts = ExtractRelativeStart(email.subject + " " + email.snippet, *sent_at);
    if (starts && *starts < now) {
      return true;
    }
  }

  if (Contains(subject, "notification:")) {
    auto event_date = ExtractCalendarDate(email.subject, YearOf(now));
    if (event_date && *event_date < now - kSubjectDateBuffer) {
      return true;
    }
  }

  return false;
}

std::vector<model::EmailRecord> FilterExpiredEvents(std::vector<model::EmailRecord> emails, util::TimePoint now, std::vector<std::string>* expired_ids) {
  std::vector<model::EmailRecord> kept;
  kept.reserve(emails.size());

  for (auto& email : emails) {
    if (IsExpiredEvent(email, now)) {
      if (expired_ids) expired_ids->push_back(email.id);
      continue;
    }
    kept.push_back(std::move(email));
  }
  return kept;
}

} // namespace digest::temporal

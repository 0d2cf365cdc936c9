#include "time.hpp"

#include <google/protobuf/util/time_util.h>

#include <array>
#include <cctype>
#include <cstdio>
#include <regex>

namespace digest::util {

namespace {

bool IsBareDate(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (i == 4 || i == 7) continue;
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  return true;
}

// Rewrites the accepted ISO-8601 spellings into the strict RFC 3339 form
// TimeUtil understands.
std::string NormalizeRfc3339(std::string_view raw) {
  std::size_t begin = 0;
  std::size_t end   = raw.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;

  std::string text(raw.substr(begin, end - begin));
  if (IsBareDate(text)) {
    return text + "T00:00:00Z";
  }

  if (text.size() > 10 && (text[10] == ' ' || text[10] == 't')) {
    text[10] = 'T';
  }
  if (!text.empty() && text.back() == 'z') {
    text.back() = 'Z';
  }

  // Split off the offset, if any, so a missing seconds field can be filled in.
  std::string offset;
  if (!text.empty() && text.back() == 'Z') {
    offset = "Z";
    text.pop_back();
  } else if (text.size() > 11) {
    const auto sign = text.find_first_of("+-", 11);
    if (sign != std::string::npos) {
      offset = text.substr(sign);
      text.erase(sign);
    }
  }

  if (text.size() > 11) {
    const auto time_part = text.substr(11);
    if (time_part.size() == 5 && time_part[2] == ':') {
      text += ":00";
    }
  }

  return text + (offset.empty() ? "Z" : offset);
}

std::string OffsetFromZone(std::string zone) {
  if (zone.empty() || zone == "Z" || zone == "UT" || zone == "UTC" || zone == "GMT") {
    return "Z";
  }
  // "+hhmm" -> "+hh:mm"
  return zone.substr(0, 3) + ":" + zone.substr(3, 2);
}

} // namespace

int MonthFromName(std::string_view name) {
  static constexpr std::array<std::string_view, 12> kMonths = {"january", "february", "march",     "april",   "may",      "june",
                                                               "july",    "august",   "september", "october", "november", "december"};
  if (name.size() < 3) return 0;

  std::string lower(name);
  for (auto& c : lower) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  for (std::size_t i = 0; i < kMonths.size(); ++i) {
    if (kMonths[i].substr(0, lower.size()) == lower) {
      return static_cast<int>(i) + 1;
    }
  }
  return 0;
}

Result<TimePoint> TimePointFromCivil(int year, int month, int day, int hour, int minute, int second) {
  if (month < 1 || month > 12 || day < 1 || hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
    return Result<TimePoint>::Err(ErrorCode::ParseError, "invalid calendar fields");
  }

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02dZ", year, month, day, hour, minute, second);
  return ParseTimestamp(buffer);
}

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds())) +
         std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ts.nanos()));
}

bool IsRepresentable(const google::protobuf::Timestamp& ts) {
  // One second of headroom on each side for the nanos part.
  constexpr auto kMaxSeconds = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count() - 1;
  constexpr auto kMinSeconds = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::min()).count() + 1;
  return ts.seconds() >= kMinSeconds && ts.seconds() <= kMaxSeconds;
}

Result<TimePoint> ParseTimestamp(std::string_view text) {
  const auto normalized = NormalizeRfc3339(text);
  if (normalized.size() <= 1) {
    return Result<TimePoint>::Err(ErrorCode::ParseError, "empty timestamp");
  }

  google::protobuf::Timestamp ts;
  if (!google::protobuf::util::TimeUtil::FromString(normalized, &ts)) {
    return Result<TimePoint>::Err(ErrorCode::ParseError, "invalid timestamp: " + std::string(text));
  }
  if (!IsRepresentable(ts)) {
    return Result<TimePoint>::Err(ErrorCode::ParseError, "timestamp out of range: " + std::string(text));
  }
  return Result<TimePoint>::Ok(FromProto(ts));
}

Result<TimePoint> ParseMailDate(std::string_view text) {
  static const std::regex kRfc2822(R"(^\s*(?:[a-z]{3},\s*)?(\d{1,2})\s+([a-z]{3,9})\s+(\d{4})\s+(\d{1,2}):(\d{2})(?::(\d{2}))?)"
                                   R"((?:\s*([+-]\d{4}|ut|utc|gmt|z))?\s*(?:\([^)]*\))?\s*$)",
                                   std::regex::ECMAScript | std::regex::icase);

  const std::string raw(text);
  std::smatch       match;
  if (!std::regex_match(raw, match, kRfc2822)) {
    // Some producers hand over ISO text instead of a mail header.
    return ParseTimestamp(text);
  }

  const int month = MonthFromName(match.str(2));
  if (month == 0) {
    return Result<TimePoint>::Err(ErrorCode::ParseError, "invalid month in mail date: " + raw);
  }

  std::string zone = match.str(7);
  for (auto& c : zone) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }

  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d%s", std::stoi(match.str(3)), month, std::stoi(match.str(1)),
                std::stoi(match.str(4)), std::stoi(match.str(5)), match[6].matched ? std::stoi(match.str(6)) : 0, OffsetFromZone(zone).c_str());

  auto parsed = ParseTimestamp(buffer);
  if (!parsed) {
    return Result<TimePoint>::Err(ErrorCode::ParseError, "invalid mail date: " + raw);
  }
  return parsed;
}

std::string FormatTimestamp(TimePoint tp) {
  return google::protobuf::util::TimeUtil::ToString(ToProto(tp));
}

} // namespace digest::util

#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"
#include "internal/util/result.hpp"

namespace digest::util {

/*
  Time utilities: single place to control clock source and timestamp parsing.

  All time points are UTC. Text without an offset is read as UTC.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// False when ts lies outside what the system clock can hold (roughly
// 1678-2262 with nanosecond ticks). FromProto requires a representable ts.
bool IsRepresentable(const google::protobuf::Timestamp& ts);

/*
  Parses ISO-8601 / RFC 3339 text. Accepts "T" or a single space between date
  and time, an optional fractional part, "Z" or "+hh:mm" offsets, and bare
  dates (midnight UTC). Valid dates the clock cannot represent are a
  ParseError.
*/
Result<TimePoint> ParseTimestamp(std::string_view text);

/*
  Parses an RFC 2822 mail date such as "Fri, 31 Oct 2025 18:55:01 +0000 (UTC)".
  Text that is not in mail form is handed to ParseTimestamp.
*/
Result<TimePoint> ParseMailDate(std::string_view text);

// 1-12 for a full or abbreviated English month name, 0 otherwise.
int MonthFromName(std::string_view name);

// UTC wall-clock fields to a time point; day overflow ("Nov 31") is a ParseError.
Result<TimePoint> TimePointFromCivil(int year, int month, int day, int hour, int minute = 0, int second = 0);

std::string FormatTimestamp(TimePoint tp);

} // namespace digest::util

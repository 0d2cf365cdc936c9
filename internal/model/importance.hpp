#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace digest::model {

enum class Importance : std::uint8_t {
  kRoutine       = 1,
  kTimeSensitive = 2,
  kCritical      = 3,
};

enum class DigestSection : std::uint8_t {
  kToday        = 1,
  kComingUp     = 2,
  kWorthKnowing = 3,
};

constexpr std::string_view ToString(Importance importance) {
  switch (importance) {
    case Importance::kCritical:
      return "critical";
    case Importance::kTimeSensitive:
      return "time_sensitive";
    case Importance::kRoutine:
    default:
      return "routine";
  }
}

constexpr std::string_view ToString(DigestSection section) {
  switch (section) {
    case DigestSection::kToday:
      return "TODAY";
    case DigestSection::kComingUp:
      return "COMING_UP";
    case DigestSection::kWorthKnowing:
    default:
      return "WORTH_KNOWING";
  }
}

// Exact, case-sensitive match against the wire names; anything else is absent.
constexpr std::optional<Importance> ParseImportance(std::string_view value) {
  if (value == "critical") return Importance::kCritical;
  if (value == "time_sensitive") return Importance::kTimeSensitive;
  if (value == "routine") return Importance::kRoutine;
  return std::nullopt;
}

// Missing or unrecognized importance is treated as routine.
constexpr Importance ImportanceOrRoutine(std::optional<Importance> importance) {
  return importance.value_or(Importance::kRoutine);
}

// routine=1, time_sensitive=2, critical=3, absent=0.
constexpr int ImportanceRank(std::optional<Importance> importance) {
  return importance ? static_cast<int>(*importance) : 0;
}

constexpr DigestSection SectionFor(Importance importance) {
  switch (importance) {
    case Importance::kCritical:
      return DigestSection::kToday;
    case Importance::kTimeSensitive:
      return DigestSection::kComingUp;
    case Importance::kRoutine:
    default:
      return DigestSection::kWorthKnowing;
  }
}

} // namespace digest::model

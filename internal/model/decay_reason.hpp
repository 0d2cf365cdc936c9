#pragma once

#include <cstdint>
#include <string_view>

namespace digest::model {

enum class DecayReason : std::uint8_t {
  kNoTemporalData             = 0,
  kNonTemporalType            = 1,
  kTemporalExpired            = 2,
  kTemporalActive             = 3,
  kTemporalUpcoming           = 4,
  kTemporalDistant            = 5,
  kTemporalDistantButCritical = 6,
  kOtpActive                  = 7,
  kDeliveryActive             = 8,
  kDeliveryStale              = 9,
};

constexpr std::string_view ToString(DecayReason reason) {
  switch (reason) {
    case DecayReason::kNoTemporalData:
      return "no_temporal_data";
    case DecayReason::kNonTemporalType:
      return "non_temporal_type";
    case DecayReason::kTemporalExpired:
      return "temporal_expired";
    case DecayReason::kTemporalActive:
      return "temporal_active";
    case DecayReason::kTemporalUpcoming:
      return "temporal_upcoming";
    case DecayReason::kTemporalDistant:
      return "temporal_distant";
    case DecayReason::kTemporalDistantButCritical:
      return "temporal_distant_but_critical";
    case DecayReason::kOtpActive:
      return "otp_active";
    case DecayReason::kDeliveryActive:
      return "delivery_active";
    case DecayReason::kDeliveryStale:
      return "delivery_stale";
  }
  return "unknown";
}

} // namespace digest::model

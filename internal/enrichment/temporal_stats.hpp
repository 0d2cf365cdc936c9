#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "internal/model/decay_reason.hpp"
#include "internal/model/importance.hpp"

namespace digest::enrichment {

struct TemporalStatsSnapshot {
  std::uint64_t total_processed{0};
  std::uint64_t escalated{0};
  std::uint64_t downgraded{0};
  std::uint64_t unchanged{0};
  std::uint64_t hidden{0};
  std::uint64_t parse_errors{0};

  std::map<std::string, std::uint64_t> decay_reasons;
};

/*
  Observability counters for temporal decay.

  Write-only from the resolution path: nothing here feeds back into a
  decision. One mutex guards the whole struct and is held only for the
  increment step.
*/
class TemporalStats {
 public:
  void RecordOutcome(model::Importance stored, model::Importance resolved, model::DecayReason reason, bool hidden);
  void RecordParseErrors(std::uint64_t count);

  TemporalStatsSnapshot Snapshot() const;

  // test hook
  void Reset();

 private:
  mutable std::mutex    mutex_;
  TemporalStatsSnapshot stats_;
};

} // namespace digest::enrichment

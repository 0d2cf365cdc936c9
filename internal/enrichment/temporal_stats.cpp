#include "temporal_stats.hpp"

namespace digest::enrichment {

void TemporalStats::RecordOutcome(model::Importance stored, model::Importance resolved, model::DecayReason reason, bool hidden) {
  const auto stored_rank   = model::ImportanceRank(stored);
  const auto resolved_rank = model::ImportanceRank(resolved);
  std::string reason_key(model::ToString(reason));

  std::lock_guard lock(mutex_);
  ++stats_.total_processed;

  if (resolved_rank > stored_rank) {
    ++stats_.escalated;
  } else if (resolved_rank < stored_rank) {
    ++stats_.downgraded;
  } else {
    ++stats_.unchanged;
  }

  if (hidden) {
    ++stats_.hidden;
  }

  ++stats_.decay_reasons[reason_key];
}

void TemporalStats::RecordParseErrors(std::uint64_t count) {
  if (count == 0) return;

  std::lock_guard lock(mutex_);
  stats_.parse_errors += count;
}

TemporalStatsSnapshot TemporalStats::Snapshot() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

void TemporalStats::Reset() {
  std::lock_guard lock(mutex_);
  stats_ = TemporalStatsSnapshot{};
}

} // namespace digest::enrichment

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/enrichment/temporal_stats.hpp"
#include "internal/model/entity.hpp"
#include "internal/temporal/temporal_resolver.hpp"
#include "internal/util/time.hpp"

namespace digest::enrichment {

/*
  Applies temporal decay to entities before digest rendering.

  Populates the audit fields (stored/resolved importance, decay reason,
  modified flag, digest section, hide flag) and records statistics. Safe to
  call from several threads at once; the only shared state is the stats
  object.
*/
class EntityEnricher {
 public:
  explicit EntityEnricher(temporal::TemporalDecayResolver resolver, std::shared_ptr<TemporalStats> stats = std::make_shared<TemporalStats>());

  void                       Enrich(model::Entity& entity, util::TimePoint now) const;
  std::vector<model::Entity> EnrichBatch(std::vector<model::Entity> entities, util::TimePoint now) const;

  /*
    Post-hoc contract checks for CI and tests. Returns one message per
    violation; never modifies the entity.
  */
  std::vector<std::string> CheckInvariants(const model::Entity& entity, util::TimePoint now) const;

  TemporalStatsSnapshot GetStats() const;
  void                  ResetStats();

 private:
  temporal::TemporalDecayResolver resolver_;
  std::shared_ptr<TemporalStats>  stats_;
};

} // namespace digest::enrichment

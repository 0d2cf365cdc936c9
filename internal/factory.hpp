#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/digest_engine.hpp"
#include "internal/dedup/entity_deduplicator.hpp"
#include "internal/enrichment/entity_enricher.hpp"
#include "internal/enrichment/temporal_stats.hpp"
#include "internal/guardrails/guardrail_matcher.hpp"
#include "internal/mapping/bridge_mapper.hpp"

namespace digest::factory {

/*
  Application

  Owns every long-lived component of the engine. Components are immutable
  after Build except the stats counters.
*/
struct Application {
  std::shared_ptr<const guardrails::GuardrailMatcher>      matcher;
  std::shared_ptr<const mapping::BridgeImportanceMapper>   mapper;
  std::shared_ptr<enrichment::TemporalStats>               stats;
  std::shared_ptr<enrichment::EntityEnricher>              enricher;
  std::shared_ptr<const dedup::EntityDeduplicator>         deduplicator;
  std::shared_ptr<const core::DigestEngine>                engine;
};

/*
  Build

  Composition root: the only place that turns runtime config into concrete
  components.
*/
Application Build(const digest::runtime::config::RuntimeConfig& config);

} // namespace digest::factory

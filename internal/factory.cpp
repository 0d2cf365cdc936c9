#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/temporal/decay_policy.hpp"
#include "internal/temporal/temporal_resolver.hpp"

namespace digest::factory {

using digest::observability::IntField;
using digest::observability::StringField;

/*
    Build full application dependency graph
*/
Application Build(const digest::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Importance mapping
  // ------------------------------------------------------------------
  app.matcher = std::make_shared<guardrails::GuardrailMatcher>(guardrails::GuardrailMatcher::FromFile(config.guardrails().path()));
  app.mapper  = std::make_shared<mapping::BridgeImportanceMapper>(app.matcher);

  // ------------------------------------------------------------------
  // Temporal enrichment
  // ------------------------------------------------------------------
  temporal::TemporalDecayResolver resolver(temporal::DecayPolicy::FromConfig(config.temporal_decay()));

  app.stats    = std::make_shared<enrichment::TemporalStats>();
  app.enricher = std::make_shared<enrichment::EntityEnricher>(std::move(resolver), app.stats);

  // ------------------------------------------------------------------
  // Dedup
  // ------------------------------------------------------------------
  std::size_t prefix_length = dedup::kDefaultEmailIdPrefixLength;
  if (config.dedup().has_email_id_prefix_length()) {
    if (config.dedup().email_id_prefix_length() > 0) {
      prefix_length = config.dedup().email_id_prefix_length();
    } else {
      DIGEST_LOG_WARN("Ignoring dedup.email_id_prefix_length=0", {IntField("default", static_cast<std::int64_t>(prefix_length))});
    }
  }
  app.deduplicator = std::make_shared<dedup::EntityDeduplicator>(prefix_length);

  app.engine = std::make_shared<core::DigestEngine>(app.mapper, app.enricher, app.deduplicator);

  DIGEST_LOG_INFO("Digest engine built", {StringField("guardrails", config.guardrails().path()),
                                          IntField("guardrail_rules", static_cast<std::int64_t>(app.matcher->RuleCount())),
                                          IntField("email_id_prefix_length", static_cast<std::int64_t>(prefix_length))});
  return app;
}

} // namespace digest::factory

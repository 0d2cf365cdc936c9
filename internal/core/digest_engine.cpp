#include "digest_engine.hpp"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "internal/dedup/entity_deduplicator.hpp"
#include "internal/enrichment/entity_enricher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/temporal/expired_events.hpp"

namespace digest::core {

using digest::observability::IntField;
using digest::observability::StringField;

DigestEngine::DigestEngine(std::shared_ptr<const mapping::BridgeImportanceMapper> mapper, std::shared_ptr<enrichment::EntityEnricher> enricher,
                           std::shared_ptr<const dedup::EntityDeduplicator> deduplicator)
    : mapper_(std::move(mapper)), enricher_(std::move(enricher)), deduplicator_(std::move(deduplicator)) {
}

std::unordered_map<std::string, mapping::BridgeDecision> DigestEngine::MapEmails(const std::vector<model::EmailRecord>& emails) const {
  std::unordered_map<std::string, mapping::BridgeDecision> decisions;
  for (const auto& email : emails) {
    decisions[email.id] = mapper_->MapEmail(email);
  }
  return decisions;
}

DigestResult DigestEngine::Process(DigestBatch batch, util::TimePoint now) const {
  const observability::ScopedLogContext log_context({IntField("batch", static_cast<std::int64_t>(++batches_))});

  DigestResult result;

  const auto received = batch.emails.size();
  batch.emails        = temporal::FilterExpiredEvents(std::move(batch.emails), now, &result.expired_email_ids);
  if (!result.expired_email_ids.empty()) {
    const std::unordered_set<std::string> expired(result.expired_email_ids.begin(), result.expired_email_ids.end());
    batch.entities.erase(std::remove_if(batch.entities.begin(), batch.entities.end(),
                                        [&expired](const model::Entity& entity) { return expired.count(entity.source_email_id) > 0; }),
                         batch.entities.end());
    DIGEST_LOG_INFO("Filtered expired events", {IntField("expired", static_cast<std::int64_t>(result.expired_email_ids.size()))});
  }

  result.decisions = MapEmails(batch.emails);

  // The bridge decision is the only authority for pre-decay importance.
  for (auto& entity : batch.entities) {
    auto it = result.decisions.find(entity.source_email_id);
    if (it != result.decisions.end() && it->second.importance) {
      entity.importance = it->second.importance;
    }
  }

  auto enriched = enricher_->EnrichBatch(std::move(batch.entities), now);
  const auto before_dedup = enriched.size();

  result.entities = deduplicator_->Deduplicate(std::move(enriched));

  for (const auto& entity : result.entities) {
    for (auto& violation : enricher_->CheckInvariants(entity, now)) {
      DIGEST_LOG_WARN("Invariant violation", {StringField("email_id", entity.source_email_id), StringField("violation", violation)});
      result.violations.push_back(std::move(violation));
    }
  }

  auto visible        = sections::DigestSectionGrouper::FilterVisible(result.entities);
  result.hidden_count = result.entities.size() - visible.size();
  result.sections     = sections::DigestSectionGrouper::GroupBySection(std::move(visible));

  DIGEST_LOG_INFO("Digest batch processed",
                  {IntField("emails", static_cast<std::int64_t>(received)), IntField("expired", static_cast<std::int64_t>(result.expired_email_ids.size())),
                   IntField("entities", static_cast<std::int64_t>(before_dedup)), IntField("deduplicated", static_cast<std::int64_t>(result.entities.size())), IntField("hidden", static_cast<std::int64_t>(result.hidden_count)),
                   IntField("violations", static_cast<std::int64_t>(result.violations.size()))});
  return result;
}

} // namespace digest::core

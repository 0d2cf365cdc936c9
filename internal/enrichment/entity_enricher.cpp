#include "entity_enricher.hpp"

#include <chrono>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"

namespace digest::enrichment {

using digest::observability::BoolField;
using digest::observability::DoubleField;
using digest::observability::StringField;
using model::Importance;

namespace {

constexpr std::size_t kSubjectPreviewChars = 50;

std::string_view EmailIdOrUnknown(const model::Entity& entity) {
  return entity.source_email_id.empty() ? std::string_view("unknown") : std::string_view(entity.source_email_id);
}

} // namespace

EntityEnricher::EntityEnricher(temporal::TemporalDecayResolver resolver, std::shared_ptr<TemporalStats> stats)
    : resolver_(std::move(resolver)), stats_(stats ? std::move(stats) : std::make_shared<TemporalStats>()) {
}

void EntityEnricher::Enrich(model::Entity& entity, util::TimePoint now) const {
  const auto type   = entity.Type();
  const auto stored = model::ImportanceOrRoutine(entity.importance);

  // Malformed timestamps arrive here as an empty window; decay then reports
  // no_temporal_data instead of failing the batch.
  const auto fields = temporal::ExtractTemporalFields(entity);
  for (const auto& error : fields.parse_errors) {
    DIGEST_LOG_WARN("temporal_parse_error", {StringField("type", model::ToString(type)), StringField("email_id", EmailIdOrUnknown(entity)), StringField("error", error)});
  }

  const auto result  = resolver_.ResolveFields(type, stored, fields, now);
  const auto section = model::SectionFor(result.resolved_importance);
  const bool hide    = resolver_.ShouldHide(type, result.resolved_importance, fields.window, now);

  entity.stored_importance   = stored;
  entity.resolved_importance = result.resolved_importance;
  entity.decay_reason        = result.decay_reason;
  entity.was_modified        = result.was_modified;
  entity.digest_section      = section;
  entity.hide_in_digest      = hide;

  stats_->RecordParseErrors(fields.parse_errors.size());
  stats_->RecordOutcome(stored, result.resolved_importance, result.decay_reason, hide);

  if (!result.was_modified && !hide) {
    return;
  }

  // No subject text here: decisions are logged without message content.
  if (fields.window.start) {
    const auto hours_until = std::chrono::duration<double, std::ratio<3600>>(*fields.window.start - now).count();
    DIGEST_LOG_INFO("temporal_resolve",
                    {StringField("email_id", EmailIdOrUnknown(entity)), StringField("type", model::ToString(type)), StringField("stored", model::ToString(stored)),
                     StringField("resolved", model::ToString(result.resolved_importance)), StringField("reason", model::ToString(result.decay_reason)),
                     StringField("section", model::ToString(section)), BoolField("modified", result.was_modified), BoolField("hidden", hide),
                     DoubleField("hours_until", hours_until), StringField("now_utc", util::FormatTimestamp(now))});
    return;
  }

  DIGEST_LOG_INFO("temporal_resolve",
                  {StringField("email_id", EmailIdOrUnknown(entity)), StringField("type", model::ToString(type)), StringField("stored", model::ToString(stored)),
                   StringField("resolved", model::ToString(result.resolved_importance)), StringField("reason", model::ToString(result.decay_reason)),
                   StringField("section", model::ToString(section)), BoolField("modified", result.was_modified), BoolField("hidden", hide),
                   StringField("now_utc", util::FormatTimestamp(now))});
}

std::vector<model::Entity> EntityEnricher::EnrichBatch(std::vector<model::Entity> entities, util::TimePoint now) const {
  for (auto& entity : entities) {
    Enrich(entity, now);
  }
  return entities;
}

std::vector<std::string> EntityEnricher::CheckInvariants(const model::Entity& entity, util::TimePoint now) const {
  std::vector<std::string> violations;
  if (!entity.IsEnriched()) {
    return violations;
  }

  const auto resolved = *entity.resolved_importance;
  const auto subject  = util::Truncate(entity.source_subject, kSubjectPreviewChars);

  if (entity.Type() == model::EntityType::kNewsletter && resolved == Importance::kCritical) {
    violations.push_back("Newsletter marked as critical: " + subject);
  }

  auto window = temporal::ExtractTemporalWindow(entity);
  if (window && window.value.end && *window.value.end < now && (resolved == Importance::kTimeSensitive || resolved == Importance::kCritical)) {
    violations.push_back("Expired event marked as " + std::string(model::ToString(resolved)) + ": " + subject);
  }

  return violations;
}

TemporalStatsSnapshot EntityEnricher::GetStats() const {
  return stats_->Snapshot();
}

void EntityEnricher::ResetStats() {
  stats_->Reset();
}

} // namespace digest::enrichment

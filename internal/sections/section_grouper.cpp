#include "section_grouper.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"

namespace digest::sections {

using digest::observability::IntField;
using digest::observability::StringField;

std::vector<model::Entity>& DigestSections::Bucket(model::DigestSection section) {
  switch (section) {
    case model::DigestSection::kToday:
      return today;
    case model::DigestSection::kComingUp:
      return coming_up;
    case model::DigestSection::kWorthKnowing:
    default:
      return worth_knowing;
  }
}

const std::vector<model::Entity>& DigestSections::Bucket(model::DigestSection section) const {
  return const_cast<DigestSections*>(this)->Bucket(section);
}

DigestSections DigestSectionGrouper::GroupBySection(std::vector<model::Entity> entities) {
  DigestSections sections;
  for (auto& entity : entities) {
    if (!entity.digest_section) {
      DIGEST_LOG_WARN("Entity has no digest section, defaulting to WORTH_KNOWING", {StringField("email_id", entity.source_email_id)});
    }
    const auto section = entity.digest_section.value_or(model::DigestSection::kWorthKnowing);
    sections.Bucket(section).push_back(std::move(entity));
  }
  return sections;
}

std::vector<model::Entity> DigestSectionGrouper::FilterVisible(std::vector<model::Entity> entities) {
  const auto total = entities.size();
  entities.erase(std::remove_if(entities.begin(), entities.end(), [](const model::Entity& e) { return e.hide_in_digest; }), entities.end());

  const auto hidden = total - entities.size();
  if (hidden > 0) {
    DIGEST_LOG_INFO("filtered_expired", {IntField("total", static_cast<std::int64_t>(total)), IntField("visible", static_cast<std::int64_t>(entities.size())),
                                         IntField("hidden", static_cast<std::int64_t>(hidden))});
  }
  return entities;
}

ImportanceGroups DigestSectionGrouper::GroupByImportance(std::vector<model::Entity> entities) {
  ImportanceGroups groups;
  for (auto& entity : entities) {
    switch (model::ImportanceOrRoutine(entity.importance)) {
      case model::Importance::kCritical:
        groups.critical.push_back(std::move(entity));
        break;
      case model::Importance::kTimeSensitive:
        groups.time_sensitive.push_back(std::move(entity));
        break;
      case model::Importance::kRoutine:
        groups.routine.push_back(std::move(entity));
        break;
    }
  }
  return groups;
}

} // namespace digest::sections

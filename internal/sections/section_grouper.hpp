#pragma once

#include <vector>

#include "internal/model/entity.hpp"

namespace digest::sections {

struct DigestSections {
  std::vector<model::Entity> today;
  std::vector<model::Entity> coming_up;
  std::vector<model::Entity> worth_knowing;

  std::vector<model::Entity>&       Bucket(model::DigestSection section);
  const std::vector<model::Entity>& Bucket(model::DigestSection section) const;

  std::size_t Size() const {
    return today.size() + coming_up.size() + worth_knowing.size();
  }
};

struct ImportanceGroups {
  std::vector<model::Entity> critical;
  std::vector<model::Entity> time_sensitive;
  std::vector<model::Entity> routine;
};

/*
  Final fan-out of an enriched, deduplicated batch for the renderer.
*/
class DigestSectionGrouper {
 public:
  // Entities without a section (not enriched) land in WORTH_KNOWING.
  static DigestSections GroupBySection(std::vector<model::Entity> entities);

  static std::vector<model::Entity> FilterVisible(std::vector<model::Entity> entities);

  // By upstream importance; absent counts as routine.
  static ImportanceGroups GroupByImportance(std::vector<model::Entity> entities);
};

} // namespace digest::sections

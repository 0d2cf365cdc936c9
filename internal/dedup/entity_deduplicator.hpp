#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/dedup/signature.hpp"
#include "internal/model/entity.hpp"

namespace digest::dedup {

/*
  Collapses duplicate entities, first within a thread, then by signature.

  The survivor of a group is the entity with the highest
  (importance rank, confidence, timestamp); on a full tie the earliest one in
  input order. Survivors keep their input order, so running the
  deduplicator twice gives the same sequence as running it once.
*/
class EntityDeduplicator {
 public:
  explicit EntityDeduplicator(std::size_t email_id_prefix_length = kDefaultEmailIdPrefixLength);

  std::vector<model::Entity> Deduplicate(std::vector<model::Entity> entities) const;

  // Groups by email_threads[source_email_id] (falling back to the email id)
  // and deduplicates each group on its own.
  std::vector<model::Entity> DeduplicateByThread(std::vector<model::Entity>                         entities,
                                                 const std::unordered_map<std::string, std::string>& email_threads) const;

  // True when a should be kept over b.
  static bool Outranks(const model::Entity& a, const model::Entity& b);

 private:
  // Indices into entities, in input order.
  std::vector<std::size_t> SurvivorIndices(const std::vector<model::Entity>& entities) const;

  std::size_t email_id_prefix_length_;
};

} // namespace digest::dedup

#include "entity_deduplicator.hpp"

#include <algorithm>
#include <tuple>
#include <utility>

namespace digest::dedup {

namespace {

// Reduces candidate indices to one survivor per key, keeping input order.
template <typename KeyFn>
std::vector<std::size_t> ReduceByKey(const std::vector<model::Entity>& entities, const std::vector<std::size_t>& candidates, KeyFn key_of) {
  std::unordered_map<std::string, std::size_t> best_by_key;
  std::vector<std::size_t>                     passthrough;

  for (const auto index : candidates) {
    auto key = key_of(entities[index]);
    if (!key) {
      passthrough.push_back(index);
      continue;
    }

    auto [it, inserted] = best_by_key.emplace(std::move(*key), index);
    if (!inserted && EntityDeduplicator::Outranks(entities[index], entities[it->second])) {
      it->second = index;
    }
  }

  std::vector<std::size_t> survivors = std::move(passthrough);
  survivors.reserve(survivors.size() + best_by_key.size());
  for (const auto& [key, index] : best_by_key) {
    survivors.push_back(index);
  }
  std::sort(survivors.begin(), survivors.end());
  return survivors;
}

std::vector<model::Entity> TakeIndices(std::vector<model::Entity>& entities, const std::vector<std::size_t>& indices) {
  std::vector<model::Entity> out;
  out.reserve(indices.size());
  for (const auto index : indices) {
    out.push_back(std::move(entities[index]));
  }
  return out;
}

} // namespace

EntityDeduplicator::EntityDeduplicator(std::size_t email_id_prefix_length) : email_id_prefix_length_(email_id_prefix_length) {
}

bool EntityDeduplicator::Outranks(const model::Entity& a, const model::Entity& b) {
  // A missing timestamp sorts below every real one.
  const auto rank_key = [](const model::Entity& e) {
    return std::make_tuple(model::ImportanceRank(e.importance), e.confidence, e.timestamp.has_value(), e.timestamp.value_or(util::TimePoint{}));
  };
  return rank_key(a) > rank_key(b);
}

std::vector<std::size_t> EntityDeduplicator::SurvivorIndices(const std::vector<model::Entity>& entities) const {
  std::vector<std::size_t> all(entities.size());
  for (std::size_t i = 0; i < all.size(); ++i) all[i] = i;

  // Pass 1: one entity per thread; entities without a thread pass through.
  const auto thread_survivors = ReduceByKey(entities, all, [](const model::Entity& e) -> std::optional<std::string> {
    if (e.source_thread_id.empty()) return std::nullopt;
    return e.source_thread_id;
  });

  // Pass 2: one entity per signature across the whole batch.
  return ReduceByKey(entities, thread_survivors,
                     [this](const model::Entity& e) -> std::optional<std::string> { return GenerateSignature(e, email_id_prefix_length_); });
}

std::vector<model::Entity> EntityDeduplicator::Deduplicate(std::vector<model::Entity> entities) const {
  if (entities.empty()) {
    return {};
  }

  const auto survivors = SurvivorIndices(entities);
  return TakeIndices(entities, survivors);
}

std::vector<model::Entity> EntityDeduplicator::DeduplicateByThread(std::vector<model::Entity>                         entities,
                                                                   const std::unordered_map<std::string, std::string>& email_threads) const {
  if (email_threads.empty()) {
    return Deduplicate(std::move(entities));
  }

  std::unordered_map<std::string, std::vector<std::size_t>> groups;
  for (std::size_t i = 0; i < entities.size(); ++i) {
    auto it = email_threads.find(entities[i].source_email_id);
    groups[it != email_threads.end() ? it->second : entities[i].source_email_id].push_back(i);
  }

  std::vector<std::size_t> survivors;
  for (const auto& [thread_id, members] : groups) {
    std::vector<model::Entity> group;
    group.reserve(members.size());
    for (const auto index : members) {
      group.push_back(entities[index]);
    }

    for (const auto local : SurvivorIndices(group)) {
      survivors.push_back(members[local]);
    }
  }
  std::sort(survivors.begin(), survivors.end());

  return TakeIndices(entities, survivors);
}

} // namespace digest::dedup

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/mapping/bridge_mapper.hpp"
#include "internal/model/email.hpp"
#include "internal/model/entity.hpp"
#include "internal/sections/section_grouper.hpp"
#include "internal/util/time.hpp"

namespace digest::enrichment {
class EntityEnricher;
}
namespace digest::dedup {
class EntityDeduplicator;
}

namespace digest::core {

struct DigestBatch {
  std::vector<model::EmailRecord> emails;
  std::vector<model::Entity>      entities;
};

struct DigestResult {
  // Enriched and deduplicated, hidden ones included.
  std::vector<model::Entity> entities;
  // Visible entities only.
  sections::DigestSections sections;

  std::unordered_map<std::string, mapping::BridgeDecision> decisions;
  std::size_t                                              hidden_count{0};
  std::vector<std::string>                                 violations;
  // Emails dropped as past events, with their entities.
  std::vector<std::string> expired_email_ids;
};

/*
  Importance resolution pipeline for one batch:

    drop expired events -> map emails -> apply decisions to entities -> temporal enrichment
    -> dedup -> invariant checks -> visibility filter -> sections

  Holds no per-batch state; concurrent Process calls are safe. Each call
  gets a batch number that is attached to every log line it writes.
*/
class DigestEngine {
 public:
  DigestEngine(std::shared_ptr<const mapping::BridgeImportanceMapper> mapper, std::shared_ptr<enrichment::EntityEnricher> enricher,
               std::shared_ptr<const dedup::EntityDeduplicator> deduplicator);

  DigestResult Process(DigestBatch batch, util::TimePoint now) const;

  std::unordered_map<std::string, mapping::BridgeDecision> MapEmails(const std::vector<model::EmailRecord>& emails) const;

 private:
  std::shared_ptr<const mapping::BridgeImportanceMapper> mapper_;
  std::shared_ptr<enrichment::EntityEnricher>            enricher_;
  std::shared_ptr<const dedup::EntityDeduplicator>       deduplicator_;

  mutable std::atomic<std::uint64_t> batches_{0};
};

} // namespace digest::core

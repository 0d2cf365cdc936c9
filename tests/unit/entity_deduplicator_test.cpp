#include "internal/dedup/entity_deduplicator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace {

using digest::dedup::EntityDeduplicator;
using digest::model::Entity;
using digest::model::EntityType;
using digest::model::Importance;
using digest::util::TimePoint;
using std::chrono::hours;

const TimePoint kBase = digest::util::ParseTimestamp("2025-06-15T08:00:00Z").value;

Entity Receipt(std::string email_id, std::string thread_id, std::string subject, std::optional<Importance> importance, double confidence,
               std::optional<TimePoint> timestamp = std::nullopt) {
  Entity entity;
  entity.source_email_id  = std::move(email_id);
  entity.source_thread_id = std::move(thread_id);
  entity.source_subject   = std::move(subject);
  entity.importance       = importance;
  entity.confidence       = confidence;
  entity.timestamp        = timestamp;
  entity.details          = digest::model::GenericDetails{EntityType::kReceipt};
  return entity;
}

Entity Shipping(std::string email_id, std::string subject, std::string status, TimePoint timestamp) {
  Entity entity;
  entity.source_email_id  = std::move(email_id);
  entity.source_thread_id = "thread-order-42";
  entity.source_subject   = std::move(subject);
  entity.importance       = Importance::kTimeSensitive;
  entity.confidence       = 0.9;
  entity.timestamp        = timestamp;
  digest::model::NotificationDetails details;
  details.category    = "shipping";
  details.ship_status = std::move(status);
  entity.details      = details;
  return entity;
}

std::vector<std::string> EmailIds(const std::vector<Entity>& entities) {
  std::vector<std::string> ids;
  for (const auto& entity : entities) ids.push_back(entity.source_email_id);
  return ids;
}

void TestEmptyBatch() {
  EntityDeduplicator dedup;
  assert(dedup.Deduplicate({}).empty());
}

void TestThreadPassKeepsBestPerThread() {
  EntityDeduplicator dedup;

  std::vector<Entity> batch;
  batch.push_back(Receipt("a", "t1", "Receipt A", Importance::kRoutine, 0.99));
  batch.push_back(Receipt("b", "t1", "Receipt B", Importance::kCritical, 0.50));
  batch.push_back(Receipt("c", "t1", "Receipt C", Importance::kTimeSensitive, 0.90));
  batch.push_back(Receipt("d", "t2", "Receipt D", Importance::kRoutine, 0.10));

  auto out = dedup.Deduplicate(std::move(batch));
  assert((EmailIds(out) == std::vector<std::string>{"b", "d"}));
}

void TestEntitiesWithoutThreadAreNotGroupedByThread() {
  EntityDeduplicator dedup;

  std::vector<Entity> batch;
  batch.push_back(Receipt("a", "", "Receipt A", Importance::kRoutine, 0.5));
  batch.push_back(Receipt("b", "", "Receipt B", Importance::kRoutine, 0.5));

  assert(dedup.Deduplicate(std::move(batch)).size() == 2);
}

void TestSignaturePassAcrossThreads() {
  EntityDeduplicator dedup;

  std::vector<Entity> batch;
  batch.push_back(Receipt("a", "t1", "Your Acme receipt", Importance::kRoutine, 0.7));
  batch.push_back(Receipt("b", "t2", "your acme receipt ", Importance::kRoutine, 0.9));
  batch.push_back(Receipt("c", "t3", "Something else", Importance::kRoutine, 0.1));

  auto out = dedup.Deduplicate(std::move(batch));
  assert((EmailIds(out) == std::vector<std::string>{"b", "c"}));
}

void TestBestSelectionOrder() {
  EntityDeduplicator dedup;

  // importance beats confidence
  {
    std::vector<Entity> batch;
    batch.push_back(Receipt("low", "", "Same receipt", Importance::kRoutine, 1.0));
    batch.push_back(Receipt("high", "", "Same receipt", Importance::kTimeSensitive, 0.1));
    batch.push_back(Receipt("none", "", "Same receipt", std::nullopt, 1.0));
    assert((EmailIds(dedup.Deduplicate(std::move(batch))) == std::vector<std::string>{"high"}));
  }

  // then confidence
  {
    std::vector<Entity> batch;
    batch.push_back(Receipt("a", "", "Same receipt", Importance::kRoutine, 0.4));
    batch.push_back(Receipt("b", "", "Same receipt", Importance::kRoutine, 0.8));
    assert((EmailIds(dedup.Deduplicate(std::move(batch))) == std::vector<std::string>{"b"}));
  }

  // then the later timestamp; a missing one loses
  {
    std::vector<Entity> batch;
    batch.push_back(Receipt("later", "", "Same receipt", Importance::kRoutine, 0.5, kBase + hours(2)));
    batch.push_back(Receipt("missing", "", "Same receipt", Importance::kRoutine, 0.5));
    batch.push_back(Receipt("earlier", "", "Same receipt", Importance::kRoutine, 0.5, kBase));
    assert((EmailIds(dedup.Deduplicate(std::move(batch))) == std::vector<std::string>{"later"}));
  }

  // full tie: first in input order
  {
    std::vector<Entity> batch;
    batch.push_back(Receipt("first", "", "Same receipt", Importance::kRoutine, 0.5, kBase));
    batch.push_back(Receipt("second", "", "Same receipt", Importance::kRoutine, 0.5, kBase));
    assert((EmailIds(dedup.Deduplicate(std::move(batch))) == std::vector<std::string>{"first"}));
  }
}

void TestManyDuplicatesYieldOneSurvivor() {
  EntityDeduplicator dedup;

  std::vector<Entity> batch;
  for (int i = 0; i < 10; ++i) {
    batch.push_back(Receipt("r" + std::to_string(i), "t" + std::to_string(i), "Same receipt", Importance::kRoutine, 0.1 * i, kBase + hours(i)));
  }

  auto out = dedup.Deduplicate(std::move(batch));
  assert(out.size() == 1);
  assert(out[0].source_email_id == "r9");
}

void TestSurvivorsKeepInputOrder() {
  EntityDeduplicator dedup;

  std::vector<Entity> batch;
  batch.push_back(Receipt("z", "", "Zeta", Importance::kRoutine, 0.5));
  batch.push_back(Receipt("a", "", "Alpha", Importance::kRoutine, 0.5));
  batch.push_back(Receipt("a2", "", "Alpha", Importance::kCritical, 0.5));
  batch.push_back(Receipt("m", "", "Mu", Importance::kRoutine, 0.5));

  assert((EmailIds(dedup.Deduplicate(std::move(batch))) == std::vector<std::string>{"z", "a2", "m"}));
}

void TestIdempotent() {
  EntityDeduplicator dedup;

  std::vector<Entity> batch;
  batch.push_back(Receipt("a", "t1", "Receipt A", Importance::kRoutine, 0.9));
  batch.push_back(Receipt("b", "t1", "Receipt B", Importance::kCritical, 0.5));
  batch.push_back(Receipt("c", "t2", "Receipt B", Importance::kRoutine, 0.5));
  batch.push_back(Receipt("d", "", "Receipt D", Importance::kRoutine, 0.5));
  batch.push_back(Receipt("e", "", "Receipt D", Importance::kTimeSensitive, 0.5));

  auto once  = dedup.Deduplicate(batch);
  auto twice = dedup.Deduplicate(once);
  assert(EmailIds(once) == EmailIds(twice));
  assert((EmailIds(once) == std::vector<std::string>{"b", "e"}));
}

void TestShippingUpdatesInOneThreadCollapse() {
  EntityDeduplicator dedup;

  std::vector<Entity> batch;
  batch.push_back(Shipping("m1", "Your order is processing", "processing", kBase));
  batch.push_back(Shipping("m2", "Your order is in transit", "in_transit", kBase + hours(20)));
  batch.push_back(Shipping("m3", "Your order has been delivered", "delivered", kBase + hours(40)));

  auto out = dedup.Deduplicate(std::move(batch));
  assert(out.size() == 1);
  assert(out[0].source_email_id == "m3");

  const auto& details = std::get<digest::model::NotificationDetails>(out[0].details);
  assert(details.ship_status == std::optional<std::string>("delivered"));
}

void TestDifferentSendersAreNotMerged() {
  EntityDeduplicator dedup;

  auto a             = Shipping("sender-one-0000000001", "Your order has been delivered", "delivered", kBase);
  auto b             = Shipping("sender-two-0000000002", "Your order has been delivered", "delivered", kBase);
  a.source_thread_id = "ta";
  b.source_thread_id = "tb";

  std::vector<Entity> batch{a, b};
  assert(dedup.Deduplicate(std::move(batch)).size() == 2);

  // with a short prefix both ids read "sender-" and merge
  EntityDeduplicator coarse(7);
  std::vector<Entity> again{a, b};
  assert(coarse.Deduplicate(std::move(again)).size() == 1);
}

void TestDeduplicateByThread() {
  EntityDeduplicator dedup;

  std::vector<Entity> batch;
  batch.push_back(Receipt("e1", "", "Receipt A", Importance::kRoutine, 0.5));
  batch.push_back(Receipt("e2", "", "Receipt B", Importance::kCritical, 0.5));
  batch.push_back(Receipt("e3", "", "Receipt A", Importance::kRoutine, 0.9));
  batch.push_back(Receipt("e4", "", "Receipt A", Importance::kRoutine, 0.9));

  const std::unordered_map<std::string, std::string> threads{{"e1", "T1"}, {"e2", "T1"}, {"e3", "T2"}};

  // e1/e2 share T1; e3 is alone in T2; e4 falls back to its own id
  auto out = dedup.DeduplicateByThread(batch, threads);
  assert((EmailIds(out) == std::vector<std::string>{"e1", "e2", "e3", "e4"}));

  // same-signature entities inside one mapped thread collapse
  batch[1].source_subject = "Receipt A";
  out                     = dedup.DeduplicateByThread(batch, threads);
  assert((EmailIds(out) == std::vector<std::string>{"e2", "e3", "e4"}));

  // no mapping: plain batch dedup
  out = dedup.DeduplicateByThread(batch, {});
  assert((EmailIds(out) == std::vector<std::string>{"e2"}));
}

} // namespace

int main() {
  TestEmptyBatch();
  TestThreadPassKeepsBestPerThread();
  TestEntitiesWithoutThreadAreNotGroupedByThread();
  TestSignaturePassAcrossThreads();
  TestBestSelectionOrder();
  TestManyDuplicatesYieldOneSurvivor();
  TestSurvivorsKeepInputOrder();
  TestIdempotent();
  TestShippingUpdatesInOneThreadCollapse();
  TestDifferentSendersAreNotMerged();
  TestDeduplicateByThread();

  std::cout << "digest_unit_entity_deduplicator: pass\n";
  return 0;
}

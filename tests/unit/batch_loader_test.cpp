#include "internal/ingest/batch_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <variant>

#include "internal/util/errors.hpp"

namespace {

using digest::ingest::LoadBatch;
using digest::ingest::ParseBatch;
using digest::model::EntityType;
using digest::model::Importance;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "digest_batch_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestLoadsEmailsAndEntities() {
  const auto path = WriteYaml("full", R"(emails:
  - id: m1
    subject: "Team offsite"
    snippet: "Agenda attached"
    type: event
    importance: time_sensitive
    date: "Sat, 14 Jun 2025 09:30:00 +0000"
    temporal_start: "2025-06-20T10:00:00"
  - id: m2
    subject: "Your package"
    snippet: "Out for delivery"
    type: notification
entities:
  - type: event
    confidence: 0.85
    source_email_id: m1
    source_thread_id: t1
    source_subject: "Team offsite"
    timestamp: "2025-06-14 09:30"
    importance: time_sensitive
    details:
      title: Offsite
      event_time: "2025-06-20T10:00:00"
      event_end_time: "2025-06-20T17:00:00"
      location: HQ
  - type: notification
    source_email_id: m2
    details:
      category: shipping
      ship_status: out_for_delivery
      action_required: true
  - type: receipt
    source_email_id: m3
    source_subject: "Receipt"
)");

  auto batch = LoadBatch(path.string());
  assert(batch.emails.size() == 2);
  assert(batch.emails[0].importance == std::optional<std::string>("time_sensitive"));
  assert(!batch.emails[1].importance);
  assert(batch.emails[0].date == std::optional<std::string>("Sat, 14 Jun 2025 09:30:00 +0000"));
  assert(batch.emails[0].temporal_start == std::optional<std::string>("2025-06-20T10:00:00"));
  assert(!batch.emails[1].date);

  assert(batch.entities.size() == 3);
  const auto& event = batch.entities[0];
  assert(event.Type() == EntityType::kEvent);
  assert(event.confidence == 0.85);
  assert(event.source_thread_id == "t1");
  assert(event.importance == Importance::kTimeSensitive);
  assert(event.timestamp == digest::util::ParseTimestamp("2025-06-14T09:30:00Z").value);
  const auto& event_details = std::get<digest::model::EventDetails>(event.details);
  assert(event_details.event_time == std::optional<std::string>("2025-06-20T10:00:00"));
  assert(!event_details.organizer);
  assert(!event.IsEnriched());

  const auto& notification = std::get<digest::model::NotificationDetails>(batch.entities[1].details);
  assert(notification.action_required);
  assert(notification.ship_status == std::optional<std::string>("out_for_delivery"));
  assert(!batch.entities[1].importance);

  assert(batch.entities[2].Type() == EntityType::kReceipt);
}

void TestBadValuesLoadAsAbsent() {
  auto batch = ParseBatch(R"(entities:
  - type: deadline
    importance: URGENT
    timestamp: "not a time"
    details:
      due_date: "whenever"
)");

  assert(batch.entities.size() == 1);
  assert(!batch.entities[0].importance);
  assert(!batch.entities[0].timestamp);
  // raw text survives for enrichment to judge
  assert(std::get<digest::model::DeadlineDetails>(batch.entities[0].details).due_date == std::optional<std::string>("whenever"));
}

void TestEmptyDocumentIsEmptyBatch() {
  auto batch = ParseBatch("");
  assert(batch.emails.empty() && batch.entities.empty());

  batch = ParseBatch("emails: []\n");
  assert(batch.emails.empty() && batch.entities.empty());
}

void TestInvalidInputIsRejected() {
  const char* sources[] = {
      "entities:\n  - type: spaceship\n",
      "entities:\n  - just-a-string\n",
      "entities:\n  - type: event\n    details: [1, 2]\n",
      "entities:\n  - type: event\n    confidence: high\n",
      "emails:\n  - subject: no id\n",
      "emails: {}\n",
      "- a\n- b\n",
      "emails: [unclosed\n",
  };

  for (const auto* source : sources) {
    bool threw = false;
    try {
      (void)ParseBatch(source);
    } catch (const digest::util::InvalidInput&) {
      threw = true;
    }
    assert(threw && "malformed batch must raise InvalidInput");
  }
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)LoadBatch((std::filesystem::temp_directory_path() / "digest_no_such_batch.yaml").string());
  } catch (const digest::util::InvalidInput&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLoadsEmailsAndEntities();
  TestBadValuesLoadAsAbsent();
  TestEmptyDocumentIsEmptyBatch();
  TestInvalidInputIsRejected();
  TestMissingFileIsRejected();

  std::cout << "digest_unit_batch_loader: pass\n";
  return 0;
}

#include "batch_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace digest::ingest {

using digest::observability::StringField;

namespace {

std::optional<std::string> OptionalString(const YAML::Node& node, const char* key) {
  const auto value = node[key];
  if (!value || value.IsNull()) return std::nullopt;
  if (!value.IsScalar()) {
    throw util::InvalidInput(std::string("field '") + key + "' must be a scalar");
  }
  return value.Scalar();
}

std::string StringOrEmpty(const YAML::Node& node, const char* key) {
  return OptionalString(node, key).value_or("");
}

std::optional<model::Importance> ReadImportance(const YAML::Node& node, const std::string& owner) {
  auto raw = OptionalString(node, "importance");
  if (!raw) return std::nullopt;

  auto importance = model::ParseImportance(*raw);
  if (!importance) {
    DIGEST_LOG_WARN("Unrecognized importance, loading as absent", {StringField("email_id", owner), StringField("importance", *raw)});
  }
  return importance;
}

std::optional<util::TimePoint> ReadTimestamp(const YAML::Node& node, const std::string& owner) {
  auto raw = OptionalString(node, "timestamp");
  if (!raw) return std::nullopt;

  auto parsed = util::ParseTimestamp(*raw);
  if (!parsed) {
    DIGEST_LOG_WARN("Malformed timestamp, loading as absent", {StringField("email_id", owner), StringField("error", parsed.message)});
    return std::nullopt;
  }
  return parsed.value;
}

model::EntityDetails ReadDetails(model::EntityType type, const YAML::Node& node) {
  switch (type) {
    case model::EntityType::kFlight:
      return model::FlightDetails{OptionalString(node, "airline"), OptionalString(node, "flight_number"), OptionalString(node, "departure_time"),
                                  OptionalString(node, "confirmation_code")};
    case model::EntityType::kEvent:
      return model::EventDetails{OptionalString(node, "title"), OptionalString(node, "event_time"), OptionalString(node, "event_end_time"),
                                 OptionalString(node, "location"), OptionalString(node, "organizer")};
    case model::EntityType::kDeadline:
      return model::DeadlineDetails{OptionalString(node, "title"), OptionalString(node, "due_date"), OptionalString(node, "amount"),
                                    OptionalString(node, "from_whom")};
    case model::EntityType::kReminder:
      return model::ReminderDetails{OptionalString(node, "from_sender"), OptionalString(node, "action"), OptionalString(node, "deadline")};
    case model::EntityType::kPromo:
      return model::PromoDetails{OptionalString(node, "merchant"), OptionalString(node, "offer"), OptionalString(node, "expiry"),
                                 OptionalString(node, "product_category")};
    case model::EntityType::kNotification: {
      model::NotificationDetails details;
      details.category = OptionalString(node, "category");
      details.message  = OptionalString(node, "message");
      if (node["action_required"] && !node["action_required"].IsNull()) {
        details.action_required = node["action_required"].as<bool>();
      }
      details.otp_expires_at  = OptionalString(node, "otp_expires_at");
      details.ship_status     = OptionalString(node, "ship_status");
      details.delivered_at    = OptionalString(node, "delivered_at");
      details.tracking_number = OptionalString(node, "tracking_number");
      return details;
    }
    default:
      return model::GenericDetails{type};
  }
}

model::EmailRecord EmailFromYaml(const YAML::Node& node) {
  if (!node.IsMap()) {
    throw util::InvalidInput("email entries must be mappings");
  }

  model::EmailRecord email;
  email.id = StringOrEmpty(node, "id");
  if (email.id.empty()) {
    throw util::InvalidInput("email entry is missing 'id'");
  }
  email.subject    = StringOrEmpty(node, "subject");
  email.snippet    = StringOrEmpty(node, "snippet");
  email.type       = StringOrEmpty(node, "type");
  email.importance     = OptionalString(node, "importance");
  email.date           = OptionalString(node, "date");
  email.temporal_start = OptionalString(node, "temporal_start");
  return email;
}

model::Entity EntityFromYaml(const YAML::Node& node) {
  if (!node.IsMap()) {
    throw util::InvalidInput("entity entries must be mappings");
  }

  const auto type_name = StringOrEmpty(node, "type");
  const auto type      = model::ParseEntityType(type_name);
  if (!type) {
    throw util::InvalidInput("unknown entity type '" + type_name + "'");
  }

  model::Entity entity;
  entity.source_email_id  = StringOrEmpty(node, "source_email_id");
  entity.source_thread_id = StringOrEmpty(node, "source_thread_id");
  entity.source_subject   = StringOrEmpty(node, "source_subject");
  entity.source_snippet   = StringOrEmpty(node, "source_snippet");
  if (node["confidence"] && !node["confidence"].IsNull()) {
    entity.confidence = node["confidence"].as<double>();
  }
  entity.timestamp  = ReadTimestamp(node, entity.source_email_id);
  entity.importance = ReadImportance(node, entity.source_email_id);

  const auto details = node["details"];
  if (details && !details.IsNull() && !details.IsMap()) {
    throw util::InvalidInput("entity 'details' must be a mapping");
  }
  entity.details = ReadDetails(*type, details && details.IsMap() ? details : YAML::Node(YAML::NodeType::Map));
  return entity;
}

core::DigestBatch BatchFromYaml(const YAML::Node& root) {
  core::DigestBatch batch;
  if (root.IsNull()) return batch;
  if (!root.IsMap()) {
    throw util::InvalidInput("batch document must be a mapping");
  }

  for (const char* key : {"emails", "entities"}) {
    const auto list = root[key];
    if (list && !list.IsNull() && !list.IsSequence()) {
      throw util::InvalidInput(std::string("'") + key + "' must be a list");
    }
  }

  try {
    for (const auto& node : root["emails"]) {
      batch.emails.push_back(EmailFromYaml(node));
    }
    for (const auto& node : root["entities"]) {
      batch.entities.push_back(EntityFromYaml(node));
    }
  } catch (const YAML::BadConversion& e) {
    throw util::InvalidInput("invalid batch value: " + std::string(e.what()));
  }
  return batch;
}

} // namespace

core::DigestBatch ParseBatch(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw util::InvalidInput("Failed to parse batch YAML: " + std::string(e.what()));
  }
  return BatchFromYaml(root);
}

core::DigestBatch LoadBatch(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidInput("Failed to load batch " + path + ": " + std::string(e.what()));
  }
  return BatchFromYaml(root);
}

} // namespace digest::ingest

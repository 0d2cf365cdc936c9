#include <chrono>
#include <iostream>
#include <string>
#include <utility>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using namespace digest;

int main(int argc, char** argv) {
  // Allow optional guardrail source override.
  auto config = config::ConfigLoader::Defaults();
  if (argc > 1) {
    config.mutable_guardrails()->set_path(argv[1]);
  }
  observability::InitializeLogging(config);

  auto app = factory::Build(config);
  auto now = util::Now();

  // One past event, one event tomorrow and a delivered parcel from two days ago.
  core::DigestBatch batch;
  batch.emails.push_back({"m-standup", "Standup moved", "see you there", "event", "critical"});
  batch.emails.push_back({"m-dinner", "Dinner tomorrow", "table for two", "event", "routine"});
  batch.emails.push_back({"m-parcel", "Your package was delivered", "left at front door", "notification", "time_sensitive"});

  model::Entity standup;
  standup.source_email_id = "m-standup";
  standup.source_subject  = "Standup moved";
  standup.details         = model::EventDetails{"Standup", util::FormatTimestamp(now - std::chrono::hours(5)), std::nullopt, std::nullopt, std::nullopt};
  batch.entities.push_back(std::move(standup));

  model::Entity dinner;
  dinner.source_email_id = "m-dinner";
  dinner.source_subject  = "Dinner tomorrow";
  dinner.details         = model::EventDetails{"Dinner", util::FormatTimestamp(now + std::chrono::hours(26)), std::nullopt, std::nullopt, std::nullopt};
  batch.entities.push_back(std::move(dinner));

  model::Entity parcel;
  parcel.source_email_id = "m-parcel";
  parcel.source_subject  = "Your package was delivered";
  model::NotificationDetails shipping;
  shipping.category     = "shipping";
  shipping.ship_status  = "delivered";
  shipping.delivered_at = util::FormatTimestamp(now - std::chrono::hours(48));
  parcel.details        = shipping;
  batch.entities.push_back(std::move(parcel));

  auto result = app.engine->Process(std::move(batch), now);

  const auto stats = app.enricher->GetStats();
  std::cout << "Temporal decay stats for " << result.entities.size() << " entities\n";
  std::cout << "outcomes: escalated=" << stats.escalated << ", downgraded=" << stats.downgraded << ", unchanged=" << stats.unchanged
            << ", hidden=" << stats.hidden << '\n';
  for (const auto& [reason, count] : stats.decay_reasons) {
    std::cout << "  " << reason << '=' << count << '\n';
  }
  std::cout << "sections: today=" << result.sections.today.size() << ", coming_up=" << result.sections.coming_up.size()
            << ", worth_knowing=" << result.sections.worth_knowing.size() << '\n';

  return 0;
}

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/batch_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

using namespace digest;

static void Usage() {
  std::cout << "Usage:\n"
            << "  digestctl [--config <file>] digest <batch.yaml> [--now <timestamp>]\n"
            << "  digestctl [--config <file>] guardrail <subject> <snippet>\n"
            << "  digestctl [--config <file>] check <batch.yaml> [--now <timestamp>]\n";
}

static std::optional<util::TimePoint> ParseNow(const std::vector<std::string>& args, std::size_t first) {
  if (args.size() == first) {
    return util::Now();
  }
  if (args.size() != first + 2 || args[first] != "--now") {
    return std::nullopt;
  }

  auto parsed = util::ParseTimestamp(args[first + 1]);
  if (!parsed) {
    std::cerr << "invalid --now: " << parsed.message << "\n";
    return std::nullopt;
  }
  return parsed.value;
}

static void PrintEntity(const model::Entity& entity) {
  std::cout << "  [" << model::ToString(model::ImportanceOrRoutine(entity.resolved_importance)) << "] " << model::ToString(entity.Type()) << " "
            << util::Truncate(entity.source_subject, 60);
  if (entity.decay_reason) {
    std::cout << " (" << model::ToString(*entity.decay_reason);
    if (entity.was_modified && entity.stored_importance) {
      std::cout << ", was " << model::ToString(*entity.stored_importance);
    }
    std::cout << ")";
  }
  std::cout << "\n";
}

static void PrintStats(const enrichment::TemporalStatsSnapshot& stats) {
  std::cout << "stats: processed=" << stats.total_processed << " escalated=" << stats.escalated << " downgraded=" << stats.downgraded
            << " unchanged=" << stats.unchanged << " hidden=" << stats.hidden << " parse_errors=" << stats.parse_errors << "\n";
  for (const auto& [reason, count] : stats.decay_reasons) {
    std::cout << "  " << reason << ": " << count << "\n";
  }
}

static int RunDigest(const factory::Application& app, const std::string& batch_path, util::TimePoint now) {
  auto result = app.engine->Process(ingest::LoadBatch(batch_path), now);

  for (const auto section : {model::DigestSection::kToday, model::DigestSection::kComingUp, model::DigestSection::kWorthKnowing}) {
    const auto& bucket = result.sections.Bucket(section);
    std::cout << model::ToString(section) << " (" << bucket.size() << ")\n";
    for (const auto& entity : bucket) {
      PrintEntity(entity);
    }
  }
  std::cout << "hidden: " << result.hidden_count << "\n";
  std::cout << "expired emails: " << result.expired_email_ids.size() << "\n";
  PrintStats(app.enricher->GetStats());
  return 0;
}

static int RunCheck(const factory::Application& app, const std::string& batch_path, util::TimePoint now) {
  auto result = app.engine->Process(ingest::LoadBatch(batch_path), now);
  if (result.violations.empty()) {
    std::cout << "ok: " << result.entities.size() << " entities, no violations\n";
    return 0;
  }
  for (const auto& violation : result.violations) {
    std::cout << violation << "\n";
  }
  return 1;
}

static int RunGuardrail(const factory::Application& app, const std::string& subject, const std::string& snippet) {
  auto match = app.matcher->Evaluate(subject, snippet);
  if (!match) {
    std::cout << "no match\n";
    return 0;
  }
  std::cout << guardrails::ToString(match->category) << " " << match->rule_name << " -> " << model::ToString(match->importance) << "\n"
            << "reason: " << match->reason << "\n";
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];

  try {
    auto config = config_path.empty() ? config::ConfigLoader::Defaults() : config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    int rc = 1;
    if (cmd == "digest" || cmd == "check") {
      if (args.size() < 2) {
        Usage();
        return 1;
      }
      auto now = ParseNow(args, 2);
      if (!now) {
        Usage();
        return 1;
      }

      auto app = factory::Build(config);
      rc       = cmd == "digest" ? RunDigest(app, args[1], *now) : RunCheck(app, args[1], *now);
    } else if (cmd == "guardrail") {
      if (args.size() != 3) {
        Usage();
        return 1;
      }
      auto app = factory::Build(config);
      rc       = RunGuardrail(app, args[1], args[2]);
    } else {
      std::cerr << "unknown command: " << cmd << "\n";
      Usage();
      return 1;
    }

    observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    DIGEST_LOG_ERROR("Fatal error", {observability::StringField("error", e.what())});
    observability::ShutdownLogging();
    return 2;
  }
}

#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "digest_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestLoadsAllSections() {
  const auto yaml_path = WriteYaml("all_sections",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
guardrails:
  path: "/etc/digest/guardrails.yaml"
temporal_decay:
  grace_period_hours: 2
  active_window_hours: 0.5
  upcoming_horizon_days: 3
dedup:
  email_id_prefix_length: 12
)");

  auto config = digest::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.guardrails().path() == "/etc/digest/guardrails.yaml");
  assert(config.temporal_decay().grace_period_hours() == 2);
  assert(config.temporal_decay().active_window_hours() == 0.5);
  assert(config.temporal_decay().upcoming_horizon_days() == 3);
  assert(!config.temporal_decay().has_delivery_stale_hours());
  assert(config.dedup().email_id_prefix_length() == 12);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(guardrails:
  path: "C:\\digest\\\"quoted\"\\guardrails.yaml"
)");

  auto config = digest::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.guardrails().path() == "C:\\digest\\\"quoted\"\\guardrails.yaml");
}

void TestMissingSectionsGetDefaults() {
  const auto yaml_path = WriteYaml("logging_only", "logging:\n  level: warn\n");

  auto config = digest::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.guardrails().path() == "config/guardrails.yaml");
  assert(!config.temporal_decay().has_grace_period_hours());
  assert(!config.dedup().has_email_id_prefix_length());

  const auto empty_path = WriteYaml("empty", "");
  auto       empty      = digest::config::ConfigLoader::LoadFromYaml(empty_path.string());
  assert(empty.guardrails().path() == "config/guardrails.yaml");

  assert(digest::config::ConfigLoader::Defaults().guardrails().path() == "config/guardrails.yaml");
}

void TestShippedConfigLoads() {
  auto config = digest::config::ConfigLoader::LoadFromYaml("config/digest-engine.yaml");
  assert(config.guardrails().path() == "config/guardrails.yaml");
  assert(config.temporal_decay().upcoming_horizon_days() == 7);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(guardrails:
  path: "config/guardrails.yaml"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)digest::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const digest::util::ConfigError&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMalformedDocumentsAreRejected() {
  for (const auto& [name, content] : {std::pair<std::string, std::string>{"list_root", "- a\n- b\n"},
                                      std::pair<std::string, std::string>{"bad_yaml", "logging: [unclosed\n"},
                                      std::pair<std::string, std::string>{"wrong_type", "dedup:\n  email_id_prefix_length: many\n"}}) {
    bool threw = false;
    try {
      (void)digest::config::ConfigLoader::LoadFromYaml(WriteYaml(name, content).string());
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  bool threw = false;
  try {
    (void)digest::config::ConfigLoader::LoadFromYaml((std::filesystem::temp_directory_path() / "digest_missing_config.yaml").string());
  } catch (const digest::util::ConfigError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLoadsAllSections();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestMissingSectionsGetDefaults();
  TestShippedConfigLoads();
  TestUnknownFieldsAreRejected();
  TestMalformedDocumentsAreRejected();

  std::cout << "digest_unit_config_loader: pass\n";
  return 0;
}

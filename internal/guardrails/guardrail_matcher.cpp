#include "guardrail_matcher.hpp"

#include <filesystem>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace digest::guardrails {

using digest::observability::IntField;
using digest::observability::StringField;

GuardrailMatcher::GuardrailMatcher(GuardrailRuleSet rules) : rules_(std::move(rules)) {
}

GuardrailMatcher GuardrailMatcher::FromFile(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    DIGEST_LOG_WARN("Guardrail config not found; guardrails disabled", {StringField("path", path)});
    return GuardrailMatcher(GuardrailRuleSet{});
  }

  GuardrailRuleSet rules;
  try {
    rules = LoadGuardrailRules(path);
  } catch (const util::ConfigError& e) {
    DIGEST_LOG_ERROR("Failed to load guardrail config; guardrails disabled", {StringField("path", path), StringField("error", e.what())});
    return GuardrailMatcher(GuardrailRuleSet{});
  }

  DIGEST_LOG_INFO("Loaded guardrails",
                  {StringField("path", path), IntField("never_surface", static_cast<std::int64_t>(rules.never_surface.size())),
                   IntField("force_critical", static_cast<std::int64_t>(rules.force_critical.size())),
                   IntField("force_non_critical", static_cast<std::int64_t>(rules.force_non_critical.size()))});
  return GuardrailMatcher(std::move(rules));
}

std::optional<GuardrailResult> GuardrailMatcher::Evaluate(std::string_view subject, std::string_view snippet) const {
  for (const auto category : kCategoryPrecedence) {
    for (const auto& rule : rules_.Bucket(category)) {
      if (!rule.Matches(subject, snippet)) continue;

      GuardrailResult result;
      result.importance = ImportanceFor(category);
      result.reason     = rule.description.empty() ? "guardrail:" + std::string(ToString(category)) + ":" + rule.name : rule.description;
      result.rule_name  = rule.name;
      result.category   = category;
      return result;
    }
  }

  return std::nullopt;
}

} // namespace digest::guardrails

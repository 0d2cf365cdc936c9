#pragma once

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/importance.hpp"

namespace digest::guardrails {

enum class GuardrailCategory : std::uint8_t {
  kNeverSurface     = 1,
  kForceCritical    = 2,
  kForceNonCritical = 3,
};

constexpr std::string_view ToString(GuardrailCategory category) {
  switch (category) {
    case GuardrailCategory::kNeverSurface:
      return "never_surface";
    case GuardrailCategory::kForceCritical:
      return "force_critical";
    case GuardrailCategory::kForceNonCritical:
    default:
      return "force_non_critical";
  }
}

// never_surface and force_non_critical both drop to routine.
constexpr model::Importance ImportanceFor(GuardrailCategory category) {
  return category == GuardrailCategory::kForceCritical ? model::Importance::kCritical : model::Importance::kRoutine;
}

// Evaluation precedence, highest first.
inline constexpr GuardrailCategory kCategoryPrecedence[] = {
    GuardrailCategory::kNeverSurface,
    GuardrailCategory::kForceCritical,
    GuardrailCategory::kForceNonCritical,
};

/*
  One declarative override rule.

  Terms are stored case-folded; regexes are compiled case-insensitive and
  only see the first 4096 characters of the subject or snippet. An empty
  list leaves that dimension unconstrained.
*/
struct GuardrailRule {
  std::string name{"guardrail"};
  std::string description;

  std::vector<std::string> subject_any;
  std::vector<std::string> snippet_any;
  std::vector<std::string> snippet_none;
  std::vector<std::regex>  subject_regex;
  std::vector<std::regex>  snippet_regex;

  bool Matches(std::string_view subject, std::string_view snippet) const;
};

struct GuardrailResult {
  model::Importance importance{model::Importance::kRoutine};
  std::string       reason;
  std::string       rule_name;
  GuardrailCategory category{GuardrailCategory::kForceNonCritical};
};

/*
  Rules bucketed by category, each bucket in declaration order.
*/
struct GuardrailRuleSet {
  std::vector<GuardrailRule> never_surface;
  std::vector<GuardrailRule> force_critical;
  std::vector<GuardrailRule> force_non_critical;

  const std::vector<GuardrailRule>& Bucket(GuardrailCategory category) const;
  std::vector<GuardrailRule>&       Bucket(GuardrailCategory category);

  std::size_t Size() const;
};

// Throws util::ConfigError on YAML syntax errors, bad structure or bad regexes.
GuardrailRuleSet ParseGuardrailRules(const std::string& yaml_text);
GuardrailRuleSet LoadGuardrailRules(const std::string& path);

} // namespace digest::guardrails

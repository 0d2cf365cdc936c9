#include "guardrail_rule.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace digest::guardrails {

namespace {

bool ContainsAny(const std::string& haystack, const std::vector<std::string>& terms) {
  for (const auto& term : terms) {
    if (haystack.find(term) != std::string::npos) return true;
  }
  return false;
}

// std::regex_search recurses per character; longer input can exhaust the stack.
constexpr std::size_t kMaxMatchChars = 4096;

bool SearchAny(std::string_view text, const std::vector<std::regex>& patterns) {
  text = text.substr(0, kMaxMatchChars);
  for (const auto& pattern : patterns) {
    if (std::regex_search(text.begin(), text.end(), pattern)) return true;
  }
  return false;
}

std::vector<std::string> ReadList(const YAML::Node& entry, const char* key) {
  std::vector<std::string> values;
  const auto node = entry[key];
  if (!node || node.IsNull()) return values;

  if (node.IsScalar()) {
    values.push_back(node.as<std::string>());
    return values;
  }
  if (!node.IsSequence()) {
    throw util::ConfigError(std::string("guardrail field '") + key + "' must be a list");
  }
  for (const auto& item : node) {
    values.push_back(item.as<std::string>());
  }
  return values;
}

std::vector<std::string> ReadTerms(const YAML::Node& entry, const char* key) {
  auto terms = ReadList(entry, key);
  for (auto& term : terms) {
    term = util::ToLower(term);
  }
  return terms;
}

std::vector<std::regex> ReadPatterns(const YAML::Node& entry, const char* key, const std::string& rule_name) {
  std::vector<std::regex> patterns;
  for (const auto& source : ReadList(entry, key)) {
    try {
      patterns.emplace_back(source, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
      throw util::ConfigError("guardrail '" + rule_name + "' has invalid " + key + " '" + source + "': " + e.what());
    }
  }
  return patterns;
}

GuardrailRule RuleFromYaml(const YAML::Node& entry) {
  if (!entry.IsMap()) {
    throw util::ConfigError("guardrail entries must be mappings");
  }

  GuardrailRule rule;
  if (entry["name"] && !entry["name"].IsNull()) {
    rule.name = entry["name"].as<std::string>();
  }
  if (entry["description"] && !entry["description"].IsNull()) {
    rule.description = entry["description"].as<std::string>();
  }
  rule.subject_any   = ReadTerms(entry, "subject_any");
  rule.snippet_any   = ReadTerms(entry, "snippet_any");
  rule.snippet_none  = ReadTerms(entry, "snippet_none");
  rule.subject_regex = ReadPatterns(entry, "subject_regex", rule.name);
  rule.snippet_regex = ReadPatterns(entry, "snippet_regex", rule.name);
  return rule;
}

} // namespace

// ------------------------------------------------------------
// Matching
// ------------------------------------------------------------

bool GuardrailRule::Matches(std::string_view subject, std::string_view snippet) const {
  const auto subject_lower = util::ToLower(subject);
  const auto snippet_lower = util::ToLower(snippet);

  if (!subject_any.empty() && !ContainsAny(subject_lower, subject_any)) {
    return false;
  }

  if (!snippet_any.empty() && !ContainsAny(snippet_lower, snippet_any)) {
    return false;
  }

  // exclusion terms veto the rule (e.g. sign-ins the user confirmed)
  if (!snippet_none.empty() && ContainsAny(snippet_lower, snippet_none)) {
    return false;
  }

  if (!subject_regex.empty() && !SearchAny(subject, subject_regex)) {
    return false;
  }

  return snippet_regex.empty() || SearchAny(snippet, snippet_regex);
}

// ------------------------------------------------------------
// Rule set
// ------------------------------------------------------------

const std::vector<GuardrailRule>& GuardrailRuleSet::Bucket(GuardrailCategory category) const {
  switch (category) {
    case GuardrailCategory::kNeverSurface:
      return never_surface;
    case GuardrailCategory::kForceCritical:
      return force_critical;
    case GuardrailCategory::kForceNonCritical:
    default:
      return force_non_critical;
  }
}

std::vector<GuardrailRule>& GuardrailRuleSet::Bucket(GuardrailCategory category) {
  const auto& self = *this;
  return const_cast<std::vector<GuardrailRule>&>(self.Bucket(category));
}

std::size_t GuardrailRuleSet::Size() const {
  return never_surface.size() + force_critical.size() + force_non_critical.size();
}

// ------------------------------------------------------------
// Loading
// ------------------------------------------------------------

GuardrailRuleSet ParseGuardrailRules(const std::string& yaml_text) {
  GuardrailRuleSet rules;

  try {
    const auto document = YAML::Load(yaml_text);
    if (!document || document.IsNull()) {
      return rules;
    }
    if (!document.IsMap()) {
      throw util::ConfigError("guardrail source must be a mapping");
    }

    const auto guardrails = document["guardrails"];
    if (!guardrails || guardrails.IsNull()) {
      return rules;
    }
    if (!guardrails.IsMap()) {
      throw util::ConfigError("'guardrails' must be a mapping of categories");
    }

    for (const auto category : kCategoryPrecedence) {
      const auto entries = guardrails[std::string(ToString(category))];
      if (!entries || entries.IsNull()) continue;
      if (!entries.IsSequence()) {
        throw util::ConfigError("guardrail category '" + std::string(ToString(category)) + "' must be a list");
      }

      auto& bucket = rules.Bucket(category);
      for (const auto& entry : entries) {
        if (entry.IsNull()) {
          DIGEST_LOG_WARN("Skipping empty guardrail entry", {observability::StringField("category", ToString(category))});
          continue;
        }
        bucket.push_back(RuleFromYaml(entry));
      }
    }
  } catch (const YAML::Exception& e) {
    throw util::ConfigError("guardrail YAML is invalid: " + std::string(e.what()));
  }

  return rules;
}

GuardrailRuleSet LoadGuardrailRules(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::ConfigError("guardrail config " + path + " could not be opened");
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return ParseGuardrailRules(buffer.str());
}

} // namespace digest::guardrails

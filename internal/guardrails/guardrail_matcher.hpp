#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "guardrail_rule.hpp"

namespace digest::guardrails {

/*
  Applies guardrail precedence: never_surface > force_critical > force_non_critical.

  Within a category the first rule in declaration order wins. The rule set is
  immutable after construction, so one matcher can be shared across threads.
*/
class GuardrailMatcher {
 public:
  explicit GuardrailMatcher(GuardrailRuleSet rules);

  // Fail-open: a missing or unparseable source yields a matcher with no rules.
  static GuardrailMatcher FromFile(const std::string& path);

  std::optional<GuardrailResult> Evaluate(std::string_view subject, std::string_view snippet) const;

  std::size_t RuleCount() const {
    return rules_.Size();
  }

 private:
  GuardrailRuleSet rules_;
};

} // namespace digest::guardrails

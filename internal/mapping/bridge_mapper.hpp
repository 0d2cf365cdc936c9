#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/guardrails/guardrail_rule.hpp"
#include "internal/model/email.hpp"
#include "internal/model/importance.hpp"

namespace digest::guardrails {
class GuardrailMatcher;
}

namespace digest::mapping {

enum class DecisionSource : std::uint8_t {
  kGuardrail = 1,
  kGemini    = 2,
};

constexpr std::string_view ToString(DecisionSource source) {
  return source == DecisionSource::kGuardrail ? "guardrail" : "gemini";
}

struct BridgeDecision {
  std::optional<model::Importance>              importance;
  std::string                                   reason;
  DecisionSource                                source{DecisionSource::kGemini};
  std::optional<std::string>                    rule_name;
  std::optional<guardrails::GuardrailCategory>  guardrail;
  bool                                          missing_llm{false};
};

/*
  Final importance before temporal decay.

  Guardrails are absolute overrides; without a match the upstream model's
  importance is used after validation.
*/
class BridgeImportanceMapper {
 public:
  explicit BridgeImportanceMapper(std::shared_ptr<const guardrails::GuardrailMatcher> matcher);

  BridgeDecision MapEmail(const model::EmailRecord& email) const;

 private:
  std::shared_ptr<const guardrails::GuardrailMatcher> matcher_;
};

} // namespace digest::mapping

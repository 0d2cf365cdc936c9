#include "bridge_mapper.hpp"

#include <utility>

#include "internal/guardrails/guardrail_matcher.hpp"
#include "internal/observability/logging.hpp"

namespace digest::mapping {

using digest::observability::StringField;

namespace {

std::string_view EmailIdOrUnknown(const model::EmailRecord& email) {
  return email.id.empty() ? std::string_view("unknown") : std::string_view(email.id);
}

} // namespace

BridgeImportanceMapper::BridgeImportanceMapper(std::shared_ptr<const guardrails::GuardrailMatcher> matcher) : matcher_(std::move(matcher)) {
}

BridgeDecision BridgeImportanceMapper::MapEmail(const model::EmailRecord& email) const {
  const auto email_id = EmailIdOrUnknown(email);

  if (matcher_) {
    if (auto guardrail = matcher_->Evaluate(email.subject, email.snippet)) {
      BridgeDecision decision;
      decision.importance = guardrail->importance;
      decision.reason     = guardrail->reason;
      decision.source     = DecisionSource::kGuardrail;
      decision.rule_name  = guardrail->rule_name;
      decision.guardrail  = guardrail->category;

      DIGEST_LOG_INFO("Guardrail applied", {StringField("email_id", email_id), StringField("rule", guardrail->rule_name),
                                            StringField("category", guardrails::ToString(guardrail->category)),
                                            StringField("importance", model::ToString(guardrail->importance))});
      return decision;
    }
  }

  BridgeDecision decision;
  decision.source = DecisionSource::kGemini;

  if (!email.importance) {
    decision.missing_llm = true;
    decision.importance  = model::ImportanceOrRoutine(std::nullopt);
  } else if (auto parsed = model::ParseImportance(*email.importance)) {
    decision.importance = *parsed;
  } else {
    DIGEST_LOG_WARN("Unknown importance, defaulting to routine", {StringField("importance", *email.importance), StringField("email_id", email_id)});
    decision.importance = model::ImportanceOrRoutine(std::nullopt);
  }

  decision.reason = "gemini importance: " + std::string(model::ToString(*decision.importance));

  DIGEST_LOG_INFO("Importance mapped",
                  {StringField("email_id", email_id), StringField("source", ToString(decision.source)), StringField("importance", model::ToString(*decision.importance))});
  return decision;
}

} // namespace digest::mapping

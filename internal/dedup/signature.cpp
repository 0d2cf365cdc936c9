#include "signature.hpp"

#include <regex>
#include <vector>

#include "internal/util/strings.hpp"

namespace digest::dedup {

namespace {

constexpr std::size_t kMinNotificationCoreChars = 3;

const std::vector<std::regex>& StatusPatterns() {
  static const std::vector<std::regex> kPatterns = [] {
    const char* sources[] = {
        R"(\bdelivered\b)",
        R"(\bout for delivery\b)",
        R"(\bshipped\b)",
        R"(\barriving\s+(soon|today|tomorrow)?\b)",
        R"(\barriving\b)",
        R"(\brate your experience\b)",
        R"(\breview\s+request\b)",
        R"(\breview\b)",
        R"(\bconfirm\b)",
        R"(\btrack\b)",
        R"(\bhas been\b)",
        R"(\bwill be\b)",
        R"(\bis\s+(now|ready|available)\b)",
        R"(\bnow\b)",
    };
    std::vector<std::regex> patterns;
    for (const auto* source : sources) {
      patterns.emplace_back(source, std::regex::ECMAScript | std::regex::icase);
    }
    return patterns;
  }();
  return kPatterns;
}

std::string Join(const char* prefix, std::initializer_list<std::string> parts) {
  std::string out(prefix);
  bool first = true;
  for (const auto& part : parts) {
    if (!first) out.push_back('_');
    first = false;
    out += part;
  }
  return out;
}

} // namespace

std::string NormalizePart(std::string_view value) {
  return util::ToLower(util::Trim(value));
}

std::string NormalizePart(const std::optional<std::string>& value) {
  return value ? NormalizePart(std::string_view(*value)) : std::string();
}

std::string NormalizeNotificationSubject(std::string_view subject) {
  const auto original = NormalizePart(subject);

  auto core = original;
  for (const auto& pattern : StatusPatterns()) {
    core = std::regex_replace(core, pattern, "");
  }

  static const std::regex kPunctuation("[,;]+");
  core = util::CollapseWhitespace(std::regex_replace(core, kPunctuation, ""));

  if (core.size() < kMinNotificationCoreChars) {
    return original;
  }
  return core;
}

std::string GenerateSignature(const model::Entity& entity, std::size_t email_id_prefix_length) {
  return std::visit(
      model::Overloaded{
          [](const model::FlightDetails& flight) {
            return Join("flight_", {NormalizePart(flight.airline), NormalizePart(flight.flight_number), NormalizePart(flight.departure_time)});
          },
          [](const model::EventDetails& event) { return Join("event_", {NormalizePart(event.title), NormalizePart(event.event_time)}); },
          [](const model::DeadlineDetails& deadline) {
            return Join("deadline_", {NormalizePart(deadline.title), NormalizePart(deadline.due_date), NormalizePart(deadline.from_whom)});
          },
          [](const model::PromoDetails& promo) { return Join("promo_", {NormalizePart(promo.merchant), NormalizePart(promo.offer)}); },
          [&](const model::NotificationDetails& notification) {
            // email id prefix keeps different senders with similar subjects apart
            const auto email_id = util::Truncate(NormalizePart(std::string_view(entity.source_email_id)), email_id_prefix_length);
            return Join("notification_", {NormalizePart(notification.category), email_id, NormalizeNotificationSubject(entity.source_subject)});
          },
          [&](const model::ReminderDetails&) {
            return NormalizePart(model::ToString(model::EntityType::kReminder)) + "_" + NormalizePart(std::string_view(entity.source_subject));
          },
          [&](const model::GenericDetails& generic) {
            return NormalizePart(model::ToString(generic.type)) + "_" + NormalizePart(std::string_view(entity.source_subject));
          },
      },
      entity.details);
}

} // namespace digest::dedup

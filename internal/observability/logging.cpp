#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace digest::observability {
namespace {

std::string ResolveLevel(const digest::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("DIGEST_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const digest::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("DIGEST_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

thread_local std::vector<LogField> t_context;

// Subjects and violation texts carry spaces; quote them so key=value stays splittable.
bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendField(std::ostringstream& out, const LogField& field) {
  if (out.tellp() > 0) {
    out << ' ';
  }
  out << field.key << '=';
  if (NeedsQuoting(field.value)) {
    out << std::quoted(field.value);
  } else {
    out << field.value;
  }
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  for (const auto& field : fields) {
    AppendField(out, field);
  }
  for (const auto& field : t_context) {
    AppendField(out, field);
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

ScopedLogContext::ScopedLogContext(std::initializer_list<LogField> fields) : restore_size_(t_context.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

ScopedLogContext::~ScopedLogContext() {
  t_context.resize(restore_size_);
}

const std::vector<LogField>& CurrentLogContext() {
  return t_context;
}

void InitializeLogging(const digest::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("digest-engine");
  if (!logger) {
    logger = spdlog::stdout_color_mt("digest-engine");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace digest::observability

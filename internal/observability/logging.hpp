#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace digest::runtime::config {
class RuntimeConfig;
}

namespace digest::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

/*
  Appends fields (batch number, email id) to every line this thread logs
  while the scope is alive. Scopes nest; inner fields come last.
*/
class ScopedLogContext {
 public:
  explicit ScopedLogContext(std::initializer_list<LogField> fields);
  ~ScopedLogContext();

  ScopedLogContext(const ScopedLogContext&)            = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

 private:
  std::size_t restore_size_;
};

// Fields of every live ScopedLogContext on this thread, outermost first.
const std::vector<LogField>& CurrentLogContext();

void InitializeLogging(const digest::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace digest::observability

#define DIGEST_LOG_INFO(message, ...) ::digest::observability::LogInfo((message), ##__VA_ARGS__)
#define DIGEST_LOG_WARN(message, ...) ::digest::observability::LogWarn((message), ##__VA_ARGS__)
#define DIGEST_LOG_ERROR(message, ...) ::digest::observability::LogError((message), ##__VA_ARGS__)

#pragma once

#include <string>
#include <utility>

namespace digest::util {

/*
  Portable result codes for recoverable failures.

  Callers are expected to branch on the code and apply their own fallback
  (fail-open guardrails, "no temporal data", routine importance).
*/

enum class ErrorCode {
  OK = 0,

  ParseError,
  ConfigError,
  ValidationError,
};

template <typename T>
struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;
  T           value{};

  static Result Ok(T value) {
    Result result;
    result.value = std::move(value);
    return result;
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    Result result;
    result.code    = c;
    result.message = std::move(msg);
    return result;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace digest::util

#pragma once

#include <stdexcept>
#include <string>

namespace digest::util {

/*
  Central error types for the outer boundary (config files, batch input).

  The engine itself never throws these; it reports recoverable failures
  through util::Result and keeps processing.
*/

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidInput : public std::runtime_error {
 public:
  explicit InvalidInput(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace digest::util

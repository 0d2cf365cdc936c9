#pragma once

#include <optional>
#include <string>

namespace digest::model {

/*
  Classified email as handed over by the upstream model.

  importance is the model's raw text; absent when the model produced none.
  date is the raw mail Date header. temporal_start is the upstream event
  start, when known.
*/
struct EmailRecord {
  std::string                id;
  std::string                subject;
  std::string                snippet;
  std::string                type;
  std::optional<std::string> importance;
  std::optional<std::string> date;
  std::optional<std::string> temporal_start;
};

} // namespace digest::model

#pragma once

#include <string>

#include "internal/core/digest_engine.hpp"

namespace digest::ingest {

/*
  Reads a digest batch from YAML:

    emails:
      - id, subject, snippet, type, importance, date, temporal_start
    entities:
      - type, confidence, source_email_id, source_thread_id,
        source_subject, source_snippet, timestamp, importance,
        details: { subtype fields }

  Structural problems and unknown entity types raise util::InvalidInput.
  Bad importance or timestamp values load as absent.
*/
core::DigestBatch ParseBatch(const std::string& yaml_text);
core::DigestBatch LoadBatch(const std::string& path);

} // namespace digest::ingest

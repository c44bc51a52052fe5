#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/parsed_name.hpp"

namespace resolver::db::model {

/*
  Persistent identity mention.

  IMPORTANT:
  - Written once at ingestion, never updated. Corrections arrive as new
    mentions with new ids.
  - blocking_key is the ingestion-time key; runs re-derive keys from the
    parsed components under the configured key version.
  - embedding is empty when the mention has none.
*/
struct MentionRecord {
  std::string mention_id;
  std::string source_reference;
  std::string source_system;
  std::string raw_name;

  resolver::model::ParsedName name;
  resolver::model::ParseType  parse_type       = resolver::model::ParseType::kUnknown;
  double                      parse_confidence = 0.0;
  bool                        parse_failed     = false;
  bool                        placeholder      = false;

  std::string blocking_key;
  std::string blocking_key_version;

  std::vector<float> embedding;
  std::string        embedding_model;

  uint64_t ingested_at_ms = 0;
};

} // namespace resolver::db::model

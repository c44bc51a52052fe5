#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/parse_type.hpp"

namespace resolver::db::model {

/*
  Resolved entity row as committed by a resolution run.

  suppression_reasons is a comma separated list of reason tags
  ("protected_flag,k_anonymity").
*/
struct EntityRecord {
  std::string                 entity_id;
  std::string                 canonical_name;
  std::string                 canonical_mention_id;
  resolver::model::ParseType  entity_type          = resolver::model::ParseType::kUnknown;
  bool                        is_verified          = false;
  bool                        suppress_from_public = false;
  double                      confidence           = 0.0;
  std::string                 suppression_reasons;
  std::string                 run_id;
  uint64_t                    resolved_at_ms = 0;
};

// One EntityMentionMap row.
struct EntityMentionRecord {
  std::string entity_id;
  std::string mention_id;
  double      composite_score = 0.0;
};

} // namespace resolver::db::model

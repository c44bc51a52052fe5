#pragma once

#include <cstdint>
#include <string>

#include "internal/model/candidate_pair.hpp"

namespace resolver::db::model {

/*
  Append-only audit row. One per classified candidate pair per run.
  Never updated, never deleted.
*/
struct MergeDecisionRecord {
  std::string                      run_id;
  std::string                      mention_id_a;
  std::string                      mention_id_b;
  resolver::model::EdgeDecision    decision = resolver::model::EdgeDecision::kDiscard;
  resolver::model::CandidateOrigin origin   = resolver::model::CandidateOrigin::kWithinBlock;
  double                           composite_score = 0.0;
  resolver::model::SignalBreakdown signals;
  std::string                      reason;
  uint64_t                         decided_at_ms = 0;
};

} // namespace resolver::db::model

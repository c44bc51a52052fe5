#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/candidate_pair.hpp"

namespace resolver::db::model {

// Pending manual-review pair from the latest committed run.
struct ReviewItemRecord {
  std::string                      run_id;
  std::string                      mention_id_a;
  std::string                      mention_id_b;
  double                           composite_score = 0.0;
  resolver::model::CandidateOrigin origin = resolver::model::CandidateOrigin::kWithinBlock;
};

enum class ReviewVerdict : std::uint8_t {
  kForceMerge = 0,
  kForceSplit = 1,
};

constexpr std::string_view ToString(ReviewVerdict verdict) {
  return verdict == ReviewVerdict::kForceMerge ? "merge" : "split";
}

/*
  Manual verdict for a pair. Keyed by (mention_id_a, mention_id_b);
  a newer verdict replaces an older one. Applied on the next run.
*/
struct ReviewOverrideRecord {
  std::string   mention_id_a;
  std::string   mention_id_b;
  ReviewVerdict verdict = ReviewVerdict::kForceSplit;
  std::string   reviewer;
  std::string   note;
  uint64_t      decided_at_ms = 0;
};

} // namespace resolver::db::model

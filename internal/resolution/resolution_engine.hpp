#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "internal/blocking/blocking_index.hpp"
#include "internal/config/resolution_settings.hpp"
#include "internal/db/model/review_record.hpp"
#include "internal/model/candidate_pair.hpp"
#include "internal/scoring/similarity_scorer.hpp"

namespace resolver::resolution {

// Sorted member mention ids -> entity_id, from the last committed run.
using PriorPartition = std::map<std::vector<std::string>, std::string>;

struct ClassifiedEdge {
  model::CandidatePair pair;
  model::EdgeDecision  decision = model::EdgeDecision::kDiscard;
  std::string          reason;
  bool                 manual = false; // decided by a review override
};

struct ResolvedEntity {
  std::string      entity_id;
  std::size_t      canonical_index = 0;
  model::ParseType entity_type     = model::ParseType::kUnknown;
  bool             is_verified     = false;
  double           confidence      = 0.0;

  // Mention indices in mention_id order; member_scores is parallel and
  // holds the best accepted edge touching the member (0 for singletons).
  std::vector<std::size_t> members;
  std::vector<double>      member_scores;
};

struct ResolutionOutcome {
  std::vector<ClassifiedEdge> edges;
  std::vector<ResolvedEntity> entities;

  // Overrides naming a mention that does not exist.
  std::vector<db::model::ReviewOverrideRecord> ignored_overrides;
};

/*
  Turns scored candidate pairs into a partition.

  1. Classify: score >= t_high Merge, [t_low, t_high) Review, else
     Discard. Cross-block pairs use both thresholds raised by
     cross_block.threshold_margin.
  2. Overrides: ForceSplit turns a pair into Discard; ForceMerge into
     Merge, scoring the pair on demand when it was not a candidate.
  3. Union-find over Merge edges in (mention_id_a, mention_id_b) order.
     A Merge edge that would join two mentions separated by a ForceSplit
     is downgraded to Review instead.
  4. Per component: canonical member, type vote, verification,
     membership confidence, entity id reuse.

  Never merges through a Review edge. Deterministic for a given input.
*/
class ResolutionEngine {
 public:
  ResolutionEngine(const blocking::BlockingIndex& index, const scoring::SimilarityScorer& scorer,
                   const config::ResolutionSettings& settings);

  model::EdgeDecision Classify(const model::CandidatePair& pair) const;

  // `pairs` must hold at most one entry per mention pair.
  ResolutionOutcome Resolve(std::vector<model::CandidatePair> pairs, const std::vector<db::model::ReviewOverrideRecord>& overrides,
                            const PriorPartition& prior) const;

  // Highest parse confidence, ties by smallest mention_id.
  std::size_t ChooseCanonical(const std::vector<std::size_t>& members) const;

  // Majority over known types; ties Organization > Household > Person.
  model::ParseType VoteType(const std::vector<std::size_t>& members) const;

 private:
  model::CandidatePair ScoreOnDemand(std::size_t x, std::size_t y, model::CandidateOrigin origin) const;

  const blocking::BlockingIndex&    index_;
  const scoring::SimilarityScorer&  scorer_;
  const config::ResolutionSettings& settings_;
};

} // namespace resolver::resolution

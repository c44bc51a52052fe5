#pragma once

#include <string_view>

#include "internal/config/resolution_settings.hpp"
#include "internal/db/model/mention_record.hpp"
#include "internal/model/candidate_pair.hpp"

namespace resolver::scoring {

// One side of a pair: the stored mention plus its run-time derivations.
struct ScoringSide {
  const db::model::MentionRecord& mention;
  std::string_view                blocking_key;
  std::string_view                comparison_name;
};

/*
  Composite match score.

    phonetic  : blocking keys equal and not the unblockable key (0/1)
    edit      : normalized Levenshtein over the comparison names
    embedding : (cosine + 1) / 2, only when both sides carry a vector from
                the configured model with equal dimensions

  composite = sum(weight * signal) / sum(weights of present signals)

  then, in order:
    either side failed to parse    -> 0
    parse types conflict           -> min(composite, type_conflict_cap)
    either side unblockable        -> min(composite, low_confidence_cap)

  Pure; the same inputs and settings give a bit-identical result.
*/
class SimilarityScorer {
 public:
  explicit SimilarityScorer(const config::ResolutionSettings& settings) : settings_(settings) {
  }

  // The returned pair has mention_id_a < mention_id_b regardless of
  // argument order.
  model::CandidatePair Score(const ScoringSide& a, const ScoringSide& b, model::CandidateOrigin origin) const;

  bool EmbeddingUsable(const db::model::MentionRecord& mention) const;

 private:
  const config::ResolutionSettings& settings_;
};

} // namespace resolver::scoring

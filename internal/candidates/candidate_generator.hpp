#pragma once

#include <cstddef>
#include <vector>

#include "internal/blocking/blocking_index.hpp"
#include "internal/candidates/embedding_index.hpp"
#include "internal/config/resolution_settings.hpp"
#include "internal/model/candidate_pair.hpp"

namespace resolver::candidates {

// Unscored pair of mention indices into the BlockingIndex; the mention at
// `a` has the smaller mention_id.
struct CandidateRef {
  std::size_t            a      = 0;
  std::size_t            b      = 0;
  model::CandidateOrigin origin = model::CandidateOrigin::kWithinBlock;
};

/*
  Candidate pair enumeration.

  ForBlock: all pairs of a block up to max_block_size members. Larger
  blocks use a sorted-neighborhood window: members ordered by comparison
  name then mention_id, each paired with the next max_block_size - 1.

  CrossBlockFor: top-k embedding neighbors of one eligible mention
  (parse confidence >= min_parse_confidence, vector from the configured
  model). Neighbors in the same block are skipped; they are already
  within-block candidates unless the block was sampled.

  Every method is const and touches only immutable inputs, so blocks can
  be handed to different workers.
*/
class CandidateGenerator {
 public:
  CandidateGenerator(const blocking::BlockingIndex& index, const config::ResolutionSettings& settings);

  std::vector<CandidateRef> ForBlock(const blocking::BlockingIndex::Block& block) const;

  bool CrossBlockEligible(std::size_t mention_index) const;

  // Index over every eligible mention. Empty when cross-block search is off.
  EmbeddingIndex BuildEmbeddingIndex() const;

  std::vector<CandidateRef> CrossBlockFor(std::size_t mention_index, const EmbeddingIndex& embeddings) const;

  // Sorts by (a's id, b's id) and keeps one ref per pair, preferring the
  // lowest origin (within-block over sampled over cross-block).
  void Deduplicate(std::vector<CandidateRef>& refs) const;

 private:
  CandidateRef MakeRef(std::size_t x, std::size_t y, model::CandidateOrigin origin) const;

  const blocking::BlockingIndex&    index_;
  const config::ResolutionSettings& settings_;
};

} // namespace resolver::candidates

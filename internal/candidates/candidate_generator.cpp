#include "internal/candidates/candidate_generator.hpp"

#include <algorithm>
#include <tuple>

namespace resolver::candidates {

using model::CandidateOrigin;

CandidateGenerator::CandidateGenerator(const blocking::BlockingIndex& index, const config::ResolutionSettings& settings)
    : index_(index), settings_(settings) {
}

CandidateRef CandidateGenerator::MakeRef(std::size_t x, std::size_t y, CandidateOrigin origin) const {
  if (index_.Mention(y).mention_id < index_.Mention(x).mention_id) std::swap(x, y);
  return CandidateRef{x, y, origin};
}

std::vector<CandidateRef> CandidateGenerator::ForBlock(const blocking::BlockingIndex::Block& block) const {
  std::vector<CandidateRef> refs;
  const auto&               members = block.members;
  const std::size_t         limit   = settings_.max_block_size;

  if (members.size() <= limit) {
    for (std::size_t i = 0; i < members.size(); ++i) {
      for (std::size_t j = i + 1; j < members.size(); ++j) {
        refs.push_back(MakeRef(members[i], members[j], CandidateOrigin::kWithinBlock));
      }
    }
    return refs;
  }

  auto ordered = members;
  std::sort(ordered.begin(), ordered.end(), [&](std::size_t x, std::size_t y) {
    return std::tie(index_.ComparisonNameOf(x), index_.Mention(x).mention_id) <
           std::tie(index_.ComparisonNameOf(y), index_.Mention(y).mention_id);
  });

  const std::size_t window = limit - 1;
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    const std::size_t end = std::min(ordered.size(), i + window + 1);
    for (std::size_t j = i + 1; j < end; ++j) {
      refs.push_back(MakeRef(ordered[i], ordered[j], CandidateOrigin::kSampledBlock));
    }
  }
  return refs;
}

bool CandidateGenerator::CrossBlockEligible(std::size_t mention_index) const {
  if (!settings_.cross_block.enabled) return false;
  const auto& mention = index_.Mention(mention_index);
  return !mention.embedding.empty() && mention.embedding_model == settings_.embedding_model_id &&
         mention.parse_confidence >= settings_.cross_block.min_parse_confidence;
}

EmbeddingIndex CandidateGenerator::BuildEmbeddingIndex() const {
  EmbeddingIndex embeddings;
  for (std::size_t i = 0; i < index_.MentionCount(); ++i) {
    if (CrossBlockEligible(i)) embeddings.Add(i, index_.Mention(i).embedding);
  }
  return embeddings;
}

std::vector<CandidateRef> CandidateGenerator::CrossBlockFor(std::size_t mention_index, const EmbeddingIndex& embeddings) const {
  std::vector<CandidateRef> refs;
  if (!CrossBlockEligible(mention_index)) return refs;

  const auto& query = index_.Mention(mention_index).embedding;
  for (const auto& neighbor : embeddings.Search(query, settings_.cross_block.top_k, settings_.cross_block.min_cosine, mention_index)) {
    if (index_.KeyOf(neighbor.id) == index_.KeyOf(mention_index)) continue;
    refs.push_back(MakeRef(mention_index, neighbor.id, CandidateOrigin::kCrossBlock));
  }
  return refs;
}

void CandidateGenerator::Deduplicate(std::vector<CandidateRef>& refs) const {
  std::sort(refs.begin(), refs.end(), [&](const CandidateRef& x, const CandidateRef& y) {
    const auto& xa = index_.Mention(x.a).mention_id;
    const auto& ya = index_.Mention(y.a).mention_id;
    if (xa != ya) return xa < ya;
    const auto& xb = index_.Mention(x.b).mention_id;
    const auto& yb = index_.Mention(y.b).mention_id;
    if (xb != yb) return xb < yb;
    return x.origin < y.origin;
  });
  refs.erase(std::unique(refs.begin(), refs.end(), [](const CandidateRef& x, const CandidateRef& y) { return x.a == y.a && x.b == y.b; }),
             refs.end());
}

} // namespace resolver::candidates

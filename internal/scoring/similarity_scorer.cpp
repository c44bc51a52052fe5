#include "internal/scoring/similarity_scorer.hpp"

#include <algorithm>

#include "internal/blocking/blocking_key.hpp"
#include "internal/scoring/string_similarity.hpp"

namespace resolver::scoring {

using model::CandidatePair;
using model::TypeAgreement;

namespace {

TypeAgreement Agreement(model::ParseType a, model::ParseType b) {
  if (model::TypesConflict(a, b)) return TypeAgreement::kConflict;
  if (a == b) return TypeAgreement::kAgree;
  return TypeAgreement::kPartial;
}

} // namespace

bool SimilarityScorer::EmbeddingUsable(const db::model::MentionRecord& mention) const {
  return !mention.embedding.empty() && !settings_.embedding_model_id.empty() &&
         mention.embedding_model == settings_.embedding_model_id;
}

CandidatePair SimilarityScorer::Score(const ScoringSide& a, const ScoringSide& b, model::CandidateOrigin origin) const {
  const bool  swap  = b.mention.mention_id < a.mention.mention_id;
  const auto& left  = swap ? b : a;
  const auto& right = swap ? a : b;

  CandidatePair pair;
  pair.mention_id_a = left.mention.mention_id;
  pair.mention_id_b = right.mention.mention_id;
  pair.origin       = origin;

  auto& signals          = pair.signals;
  signals.type_agreement = Agreement(left.mention.parse_type, right.mention.parse_type);
  signals.low_confidence = left.blocking_key == blocking::kUnblockableKey || right.blocking_key == blocking::kUnblockableKey;
  signals.parse_failed   = left.mention.parse_failed || right.mention.parse_failed;

  if (signals.parse_failed) {
    pair.composite_score = 0.0;
    return pair;
  }

  signals.phonetic_match  = !signals.low_confidence && left.blocking_key == right.blocking_key;
  signals.edit_similarity = NormalizedLevenshteinSimilarity(left.comparison_name, right.comparison_name);

  double weighted     = settings_.weights.phonetic * (signals.phonetic_match ? 1.0 : 0.0) +
                    settings_.weights.edit * signals.edit_similarity;
  double total_weight = settings_.weights.phonetic + settings_.weights.edit;

  if (EmbeddingUsable(left.mention) && EmbeddingUsable(right.mention) &&
      left.mention.embedding.size() == right.mention.embedding.size()) {
    const double mapped          = (Cosine(left.mention.embedding, right.mention.embedding) + 1.0) / 2.0;
    signals.embedding_similarity = mapped;
    weighted += settings_.weights.embedding * mapped;
    total_weight += settings_.weights.embedding;
  }

  double composite = total_weight > 0.0 ? weighted / total_weight : 0.0;
  composite        = std::clamp(composite, 0.0, 1.0);

  if (signals.type_agreement == TypeAgreement::kConflict && composite > settings_.type_conflict_cap) {
    composite       = settings_.type_conflict_cap;
    signals.capped  = true;
  }
  if (signals.low_confidence && composite > settings_.low_confidence_cap) {
    composite      = settings_.low_confidence_cap;
    signals.capped = true;
  }

  pair.composite_score = composite;
  return pair;
}

} // namespace resolver::scoring

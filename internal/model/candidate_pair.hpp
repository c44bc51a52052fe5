#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace resolver::model {

enum class CandidateOrigin : std::uint8_t {
  kWithinBlock  = 0,
  kSampledBlock = 1,
  kCrossBlock   = 2,
  kOverride     = 3,
};

constexpr std::string_view ToString(CandidateOrigin origin) {
  switch (origin) {
    case CandidateOrigin::kSampledBlock:
      return "sampled_block";
    case CandidateOrigin::kCrossBlock:
      return "cross_block";
    case CandidateOrigin::kOverride:
      return "override";
    case CandidateOrigin::kWithinBlock:
    default:
      return "within_block";
  }
}

enum class TypeAgreement : std::uint8_t {
  kAgree    = 0,
  kPartial  = 1, // one side Unknown
  kConflict = 2,
};

constexpr std::string_view ToString(TypeAgreement agreement) {
  switch (agreement) {
    case TypeAgreement::kPartial:
      return "partial";
    case TypeAgreement::kConflict:
      return "conflict";
    case TypeAgreement::kAgree:
    default:
      return "agree";
  }
}

// Per-signal breakdown kept with every scored pair and every logged decision.
struct SignalBreakdown {
  bool                  phonetic_match  = false;
  double                edit_similarity = 0.0;
  std::optional<double> embedding_similarity;
  TypeAgreement         type_agreement = TypeAgreement::kAgree;
  bool                  low_confidence = false;
  bool                  parse_failed   = false;
  bool                  capped         = false;
};

/*
  Ephemeral scored pair. mention_id_a < mention_id_b always holds so that
  a pair has exactly one representation.
*/
struct CandidatePair {
  std::string     mention_id_a;
  std::string     mention_id_b;
  CandidateOrigin origin          = CandidateOrigin::kWithinBlock;
  double          composite_score = 0.0;
  SignalBreakdown signals;
};

inline bool PairLess(const CandidatePair& lhs, const CandidatePair& rhs) {
  if (lhs.mention_id_a != rhs.mention_id_a) return lhs.mention_id_a < rhs.mention_id_a;
  return lhs.mention_id_b < rhs.mention_id_b;
}

enum class EdgeDecision : std::uint8_t {
  kMerge   = 0,
  kReview  = 1,
  kDiscard = 2,
};

constexpr std::string_view ToString(EdgeDecision decision) {
  switch (decision) {
    case EdgeDecision::kMerge:
      return "merge";
    case EdgeDecision::kReview:
      return "review";
    case EdgeDecision::kDiscard:
    default:
      return "discard";
  }
}

} // namespace resolver::model

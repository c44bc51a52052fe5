#include "internal/resolution/resolution_engine.hpp"

#include <algorithm>
#include <array>
#include <set>
#include <utility>

#include "internal/resolution/union_find.hpp"
#include "internal/util/uuid.hpp"

namespace resolver::resolution {

using db::model::ReviewOverrideRecord;
using db::model::ReviewVerdict;
using model::CandidateOrigin;
using model::CandidatePair;
using model::EdgeDecision;

namespace {

using PairKey = std::pair<std::string, std::string>;

PairKey KeyOf(const std::string& x, const std::string& y) {
  return x < y ? PairKey{x, y} : PairKey{y, x};
}

std::string ReasonFor(EdgeDecision decision, const CandidatePair& pair) {
  std::string reason;
  switch (decision) {
    case EdgeDecision::kMerge:
      reason = "above_t_high";
      break;
    case EdgeDecision::kReview:
      reason = "review_band";
      break;
    case EdgeDecision::kDiscard:
    default:
      reason = pair.signals.parse_failed ? "parse_failed" : "below_t_low";
      break;
  }
  if (pair.signals.capped) {
    reason += pair.signals.type_agreement == model::TypeAgreement::kConflict ? ";type_conflict_cap" : ";low_confidence_cap";
  }
  return reason;
}

} // namespace

ResolutionEngine::ResolutionEngine(const blocking::BlockingIndex& index, const scoring::SimilarityScorer& scorer,
                                   const config::ResolutionSettings& settings)
    : index_(index), scorer_(scorer), settings_(settings) {
}

EdgeDecision ResolutionEngine::Classify(const CandidatePair& pair) const {
  double t_low  = settings_.t_low;
  double t_high = settings_.t_high;
  if (pair.origin == CandidateOrigin::kCrossBlock) {
    t_low  = std::min(1.0, t_low + settings_.cross_block.threshold_margin);
    t_high = std::min(1.0, t_high + settings_.cross_block.threshold_margin);
  }

  if (pair.composite_score >= t_high) return EdgeDecision::kMerge;
  if (pair.composite_score >= t_low) return EdgeDecision::kReview;
  return EdgeDecision::kDiscard;
}

CandidatePair ResolutionEngine::ScoreOnDemand(std::size_t x, std::size_t y, CandidateOrigin origin) const {
  const scoring::ScoringSide a{index_.Mention(x), index_.KeyOf(x), index_.ComparisonNameOf(x)};
  const scoring::ScoringSide b{index_.Mention(y), index_.KeyOf(y), index_.ComparisonNameOf(y)};
  return scorer_.Score(a, b, origin);
}

std::size_t ResolutionEngine::ChooseCanonical(const std::vector<std::size_t>& members) const {
  std::size_t best = members.front();
  for (std::size_t m : members) {
    const auto& candidate = index_.Mention(m);
    const auto& current   = index_.Mention(best);
    if (candidate.parse_confidence > current.parse_confidence ||
        (candidate.parse_confidence == current.parse_confidence && candidate.mention_id < current.mention_id)) {
      best = m;
    }
  }
  return best;
}

model::ParseType ResolutionEngine::VoteType(const std::vector<std::size_t>& members) const {
  std::array<std::size_t, 4> votes{};
  for (std::size_t m : members) {
    const auto type = index_.Mention(m).parse_type;
    if (type != model::ParseType::kUnknown) ++votes[static_cast<std::size_t>(type)];
  }

  // precedence order for ties
  constexpr std::array<model::ParseType, 3> kPrecedence = {model::ParseType::kOrganization, model::ParseType::kHousehold,
                                                           model::ParseType::kPerson};
  model::ParseType winner     = model::ParseType::kUnknown;
  std::size_t      best_votes = 0;
  for (auto type : kPrecedence) {
    const auto count = votes[static_cast<std::size_t>(type)];
    if (count > best_votes) {
      winner     = type;
      best_votes = count;
    }
  }
  return winner;
}

ResolutionOutcome ResolutionEngine::Resolve(std::vector<CandidatePair> pairs, const std::vector<ReviewOverrideRecord>& overrides,
                                            const PriorPartition& prior) const {
  ResolutionOutcome outcome;

  std::map<PairKey, ReviewVerdict> verdicts;
  for (const auto& o : overrides) {
    verdicts[KeyOf(o.mention_id_a, o.mention_id_b)] = o.verdict;
  }

  // Classification with overrides applied to existing candidates.
  std::set<PairKey> seen;
  outcome.edges.reserve(pairs.size());
  for (auto& pair : pairs) {
    ClassifiedEdge edge;
    edge.decision = Classify(pair);
    edge.reason   = ReasonFor(edge.decision, pair);

    const PairKey key{pair.mention_id_a, pair.mention_id_b};
    if (auto it = verdicts.find(key); it != verdicts.end()) {
      seen.insert(key);
      edge.manual   = true;
      edge.decision = it->second == ReviewVerdict::kForceMerge ? EdgeDecision::kMerge : EdgeDecision::kDiscard;
      edge.reason   = it->second == ReviewVerdict::kForceMerge ? "manual_force_merge" : "manual_force_split";
    }
    edge.pair = std::move(pair);
    outcome.edges.push_back(std::move(edge));
  }

  // Verdicts on pairs that were never candidates.
  std::vector<std::pair<std::size_t, std::size_t>> splits;
  for (const auto& o : overrides) {
    const auto x = index_.IndexOf(o.mention_id_a);
    const auto y = index_.IndexOf(o.mention_id_b);
    if (!x || !y || *x == *y) {
      outcome.ignored_overrides.push_back(o);
      continue;
    }
    if (o.verdict == ReviewVerdict::kForceSplit) {
      splits.emplace_back(*x, *y);
      continue;
    }
    if (seen.contains(KeyOf(o.mention_id_a, o.mention_id_b))) continue;

    ClassifiedEdge edge;
    edge.pair     = ScoreOnDemand(*x, *y, CandidateOrigin::kOverride);
    edge.decision = EdgeDecision::kMerge;
    edge.reason   = "manual_force_merge";
    edge.manual   = true;
    outcome.edges.push_back(std::move(edge));
  }

  std::sort(outcome.edges.begin(), outcome.edges.end(),
            [](const ClassifiedEdge& l, const ClassifiedEdge& r) { return model::PairLess(l.pair, r.pair); });

  // Single-writer union over Merge edges.
  const std::size_t n = index_.MentionCount();
  UnionFind         uf(n);
  std::vector<bool> applied(outcome.edges.size(), false);

  const auto violates_split = [&](std::size_t x, std::size_t y) {
    const auto rx = uf.Find(x);
    const auto ry = uf.Find(y);
    for (const auto& [s, t] : splits) {
      const auto rs = uf.Find(s);
      const auto rt = uf.Find(t);
      if ((rs == rx && rt == ry) || (rs == ry && rt == rx)) return true;
    }
    return false;
  };

  for (std::size_t e = 0; e < outcome.edges.size(); ++e) {
    auto& edge = outcome.edges[e];
    if (edge.decision != EdgeDecision::kMerge) continue;

    const auto x = *index_.IndexOf(edge.pair.mention_id_a);
    const auto y = *index_.IndexOf(edge.pair.mention_id_b);
    if (violates_split(x, y)) {
      edge.decision = EdgeDecision::kReview;
      edge.reason   = "blocked_by_manual_split";
      continue;
    }
    uf.Unite(x, y);
    applied[e] = true;
  }

  // Components in mention_id order of their smallest member.
  std::map<std::size_t, std::vector<std::size_t>> by_root;
  std::vector<std::size_t>                        order(n);
  for (std::size_t i = 0; i < n; ++i) order[i] = i;
  std::sort(order.begin(), order.end(),
            [&](std::size_t l, std::size_t r) { return index_.Mention(l).mention_id < index_.Mention(r).mention_id; });

  std::vector<std::size_t> root_order;
  for (std::size_t i : order) {
    const auto root    = uf.Find(i);
    auto&      members = by_root[root];
    if (members.empty()) root_order.push_back(root);
    members.push_back(i);
  }

  std::map<PairKey, const ClassifiedEdge*> edge_by_pair;
  for (const auto& edge : outcome.edges) {
    edge_by_pair[{edge.pair.mention_id_a, edge.pair.mention_id_b}] = &edge;
  }

  std::vector<double> best_score(n, 0.0);
  std::vector<double> min_accepted(n, 1.0);
  for (std::size_t e = 0; e < outcome.edges.size(); ++e) {
    if (!applied[e]) continue;
    const auto& pair = outcome.edges[e].pair;
    const auto  x    = *index_.IndexOf(pair.mention_id_a);
    const auto  y    = *index_.IndexOf(pair.mention_id_b);
    best_score[x]    = std::max(best_score[x], pair.composite_score);
    best_score[y]    = std::max(best_score[y], pair.composite_score);
    auto& floor      = min_accepted[uf.Find(x)];
    floor            = std::min(floor, pair.composite_score);
  }

  outcome.entities.reserve(root_order.size());
  for (std::size_t root : root_order) {
    const auto&    members = by_root[root];
    ResolvedEntity entity;
    entity.members         = members;
    entity.canonical_index = ChooseCanonical(members);
    entity.entity_type     = VoteType(members);

    if (members.size() == 1) {
      entity.confidence = index_.Mention(members.front()).parse_confidence;
      entity.member_scores.push_back(0.0);
    } else {
      entity.confidence = min_accepted[root];
      for (std::size_t m : members) entity.member_scores.push_back(best_score[m]);
    }

    // Verification: every intra-cluster pair confirmed.
    if (members.size() > 1 && members.size() <= settings_.max_block_size) {
      bool verified = true;
      for (std::size_t i = 0; i < members.size() && verified; ++i) {
        for (std::size_t j = i + 1; j < members.size() && verified; ++j) {
          const auto key = KeyOf(index_.Mention(members[i]).mention_id, index_.Mention(members[j]).mention_id);
          if (auto it = edge_by_pair.find(key); it != edge_by_pair.end()) {
            const auto* edge = it->second;
            if (edge->manual && edge->decision == EdgeDecision::kMerge) continue;
            verified = edge->pair.composite_score >= settings_.t_high;
          } else {
            verified = ScoreOnDemand(members[i], members[j], CandidateOrigin::kWithinBlock).composite_score >= settings_.t_high;
          }
        }
      }
      entity.is_verified = verified;
    }

    std::vector<std::string> ids;
    ids.reserve(members.size());
    for (std::size_t m : members) ids.push_back(index_.Mention(m).mention_id);
    if (auto it = prior.find(ids); it != prior.end()) {
      entity.entity_id = it->second;
    } else {
      entity.entity_id = util::NewId();
    }

    outcome.entities.push_back(std::move(entity));
  }

  return outcome;
}

} // namespace resolver::resolution

#include "internal/provenance/suppression_policy.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "internal/blocking/blocking_key.hpp"
#include "internal/parser/name_normalizer.hpp"
#include "internal/parser/rule_name_parser.hpp"

namespace resolver::provenance {

SuppressionPolicy::SuppressionPolicy(const blocking::BlockingIndex& index, const config::ResolutionSettings& settings,
                                     const std::vector<db::model::ProtectionFlagRecord>&  flags,
                                     const std::vector<db::model::SuppressionLatchRecord>& latches)
    : index_(index), settings_(settings) {
  for (const auto& flag : flags) protected_.insert(flag.mention_id);
  for (const auto& latch : latches) latched_.insert(latch.mention_id);
}

std::string SuppressionPolicy::QuasiIdentifier(const resolution::ResolvedEntity& entity) const {
  const auto& key = index_.KeyOf(entity.canonical_index);
  if (key != blocking::kUnblockableKey) return key;
  return "~" + parser::NormalizeFullName(index_.Mention(entity.canonical_index).raw_name);
}

std::vector<SuppressionDecision> SuppressionPolicy::Evaluate(const std::vector<resolution::ResolvedEntity>& entities) const {
  std::map<std::string, std::size_t> crowd;
  std::vector<std::string>           quasi;
  quasi.reserve(entities.size());
  for (const auto& entity : entities) {
    quasi.push_back(QuasiIdentifier(entity));
    ++crowd[quasi.back()];
  }

  std::vector<SuppressionDecision> decisions;
  decisions.reserve(entities.size());
  for (std::size_t e = 0; e < entities.size(); ++e) {
    const auto& entity = entities[e];

    bool   flagged     = false;
    bool   placeholder = false;
    bool   latched     = false;
    double best        = 0.0;
    for (std::size_t m : entity.members) {
      const auto& mention = index_.Mention(m);
      flagged |= protected_.contains(mention.mention_id);
      latched |= latched_.contains(mention.mention_id);
      placeholder |= mention.placeholder && parser::IsDescriptivePlaceholder(mention.raw_name);
      best = std::max(best, mention.parse_confidence);
    }

    SuppressionDecision decision;
    if (flagged) decision.reasons.emplace_back(kReasonProtectedFlag);
    if (placeholder && settings_.suppression.placeholders_are_protected) {
      decision.reasons.emplace_back(kReasonDescriptivePlaceholder);
    }
    // confidence 0 carries nothing identifying
    if (best > 0.0 && best < settings_.suppression.k_anonymity_confidence_floor &&
        crowd[quasi[e]] < settings_.suppression.k_anonymity_k) {
      decision.reasons.emplace_back(kReasonKAnonymity);
    }
    if (latched) decision.reasons.emplace_back(kReasonPriorSuppression);

    decision.suppressed = !decision.reasons.empty();
    decisions.push_back(std::move(decision));
  }
  return decisions;
}

} // namespace resolver::provenance

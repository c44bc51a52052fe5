#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "internal/blocking/blocking_index.hpp"
#include "internal/config/resolution_settings.hpp"
#include "internal/db/model/suppression_record.hpp"
#include "internal/resolution/resolution_engine.hpp"

namespace resolver::provenance {

inline constexpr std::string_view kReasonProtectedFlag          = "protected_flag";
inline constexpr std::string_view kReasonDescriptivePlaceholder = "descriptive_placeholder";
inline constexpr std::string_view kReasonKAnonymity             = "k_anonymity";
inline constexpr std::string_view kReasonPriorSuppression       = "prior_suppression";

struct SuppressionDecision {
  bool                     suppressed = false;
  std::vector<std::string> reasons; // fixed order, no duplicates
};

/*
  Public-visibility suppression, re-evaluated over the whole partition on
  every run.

  An entity is suppressed when any of these hold:
    protected_flag          a member has a protection flag
    descriptive_placeholder a member is "Female (2)"-style and
                            placeholders_are_protected is on
    k_anonymity             best member confidence in (0, floor) and fewer
                            than k entities share its quasi-identifier
    prior_suppression       a member was latched by an earlier run

  The last rule makes suppression monotonic: the caller latches every
  member of every suppressed entity.
*/
class SuppressionPolicy {
 public:
  SuppressionPolicy(const blocking::BlockingIndex& index, const config::ResolutionSettings& settings,
                    const std::vector<db::model::ProtectionFlagRecord>&  flags,
                    const std::vector<db::model::SuppressionLatchRecord>& latches);

  // One decision per entity, parallel to `entities`.
  std::vector<SuppressionDecision> Evaluate(const std::vector<resolution::ResolvedEntity>& entities) const;

  // Blocking key of the canonical member, or its normalized name when the
  // entity sits in the unblockable block.
  std::string QuasiIdentifier(const resolution::ResolvedEntity& entity) const;

 private:
  const blocking::BlockingIndex&    index_;
  const config::ResolutionSettings& settings_;
  std::set<std::string>             protected_;
  std::set<std::string>             latched_;
};

} // namespace resolver::provenance

#include "internal/provenance/suppression_policy.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/parser/rule_name_parser.hpp"

namespace {

using resolver::blocking::BlockingIndex;
using resolver::config::ResolutionSettings;
using resolver::db::model::MentionRecord;
using resolver::db::model::ProtectionFlagRecord;
using resolver::db::model::SuppressionLatchRecord;
using resolver::provenance::SuppressionPolicy;
using resolver::resolution::ResolvedEntity;

MentionRecord MakeMention(const std::string& id, const std::string& raw) {
  resolver::parser::RuleNameParser parser;
  const auto                       parsed = parser.Parse(raw);

  MentionRecord m;
  m.mention_id       = id;
  m.source_reference = "doc-1";
  m.raw_name         = raw;
  m.name             = parsed.name;
  m.parse_type       = parsed.type;
  m.parse_confidence = parsed.confidence;
  m.parse_failed     = parsed.failed;
  m.placeholder      = parsed.placeholder;
  return m;
}

// One singleton entity per mention.
std::vector<ResolvedEntity> Singletons(const BlockingIndex& index) {
  std::vector<ResolvedEntity> entities;
  for (std::size_t i = 0; i < index.MentionCount(); ++i) {
    ResolvedEntity entity;
    entity.entity_id       = "e" + std::to_string(i);
    entity.canonical_index = i;
    entity.members         = {i};
    entity.member_scores   = {0.0};
    entities.push_back(entity);
  }
  return entities;
}

bool HasReason(const resolver::provenance::SuppressionDecision& d, std::string_view reason) {
  for (const auto& r : d.reasons) {
    if (r == reason) return true;
  }
  return false;
}

void TestProtectedFlagSuppressesWholeEntity() {
  std::vector<MentionRecord> mentions = {MakeMention("m1", "Jeffrey Epstein"), MakeMention("m2", "Jeffrey Epstein")};
  auto                       index    = BlockingIndex::Build(mentions, resolver::config::kBlockingKeySoundexV1);
  ResolutionSettings         settings;

  ResolvedEntity merged;
  merged.canonical_index = 0;
  merged.members         = {0, 1};
  merged.member_scores   = {1.0, 1.0};

  SuppressionPolicy policy(index, settings, {ProtectionFlagRecord{"m2", "victim", 1}}, {});
  auto              decisions = policy.Evaluate({merged});
  assert(decisions.size() == 1);
  assert(decisions[0].suppressed);
  assert(decisions[0].reasons == std::vector<std::string>{"protected_flag"});
}

void TestDescriptivePlaceholder() {
  std::vector<MentionRecord> mentions = {MakeMention("m1", "Female (2)"), MakeMention("m2", "Unknown")};
  auto                       index    = BlockingIndex::Build(mentions, resolver::config::kBlockingKeySoundexV1);
  ResolutionSettings         settings;
  settings.suppression.k_anonymity_k = 1;

  SuppressionPolicy policy(index, settings, {}, {});
  auto              decisions = policy.Evaluate(Singletons(index));
  assert(decisions[0].suppressed);
  assert(HasReason(decisions[0], resolver::provenance::kReasonDescriptivePlaceholder));
  // "Unknown" stands in for a name but describes nobody
  assert(!decisions[1].suppressed);

  settings.suppression.placeholders_are_protected = false;
  SuppressionPolicy relaxed(index, settings, {}, {});
  assert(!relaxed.Evaluate(Singletons(index))[0].suppressed);
}

void TestKAnonymity() {
  std::vector<MentionRecord> mentions = {
      MakeMention("m1", "Epstein"), MakeMention("m2", "Madonna"), MakeMention("m3", "Mathonna"), MakeMention("m4", "?"),
      MakeMention("m5", "Jeffrey Epstein"),
  };
  auto               index = BlockingIndex::Build(mentions, resolver::config::kBlockingKeySoundexV1);
  ResolutionSettings settings;

  SuppressionPolicy policy(index, settings, {}, {});
  auto              entities  = Singletons(index);
  auto              decisions = policy.Evaluate(entities);

  assert(policy.QuasiIdentifier(entities[0]) == "E123");
  assert(policy.QuasiIdentifier(entities[3]) == "~");

  // alone under its quasi-identifier with confidence 0.1
  assert(decisions[0].reasons == std::vector<std::string>{"k_anonymity"});
  // two low-confidence entities share M350
  assert(!decisions[1].suppressed);
  assert(!decisions[2].suppressed);
  // confidence 0 is exempt
  assert(!decisions[3].suppressed);
  // above the confidence floor
  assert(!decisions[4].suppressed);
}

void TestPriorLatchKeepsSuppression() {
  std::vector<MentionRecord> mentions = {MakeMention("m1", "Jeffrey Epstein"), MakeMention("m2", "Jeffrey Epstein")};
  auto                       index    = BlockingIndex::Build(mentions, resolver::config::kBlockingKeySoundexV1);
  ResolutionSettings         settings;

  ResolvedEntity merged;
  merged.canonical_index = 0;
  merged.members         = {0, 1};
  merged.member_scores   = {1.0, 1.0};

  SuppressionPolicy policy(index, settings, {}, {SuppressionLatchRecord{"m1", "k_anonymity", "run-1", 1}});
  auto              decision = policy.Evaluate({merged})[0];
  assert(decision.suppressed);
  assert(decision.reasons == std::vector<std::string>{"prior_suppression"});
}

void TestReasonsKeepFixedOrder() {
  std::vector<MentionRecord> mentions = {MakeMention("m1", "Male")};
  auto                       index    = BlockingIndex::Build(mentions, resolver::config::kBlockingKeySoundexV1);
  ResolutionSettings         settings;

  SuppressionPolicy policy(index, settings, {ProtectionFlagRecord{"m1", "upstream", 1}},
                           {SuppressionLatchRecord{"m1", "protected_flag", "run-1", 1}});
  auto              decision = policy.Evaluate(Singletons(index))[0];
  assert((decision.reasons ==
          std::vector<std::string>{"protected_flag", "descriptive_placeholder", "k_anonymity", "prior_suppression"}));
}

} // namespace

int main() {
  TestProtectedFlagSuppressesWholeEntity();
  TestDescriptivePlaceholder();
  TestKAnonymity();
  TestPriorLatchKeepsSuppression();
  TestReasonsKeepFixedOrder();

  std::cout << "resolver_unit_suppression_policy: pass\n";
  return 0;
}

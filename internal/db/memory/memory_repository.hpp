#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace resolver::db::memory {

class MemoryTransaction;

/*
  In-process backend. Used by tests and by `database: { memory: {} }`
  dry runs. Ordered containers keep List* output deterministic.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                              InsertMention(Transaction&, const model::MentionRecord&) override;
  std::optional<model::MentionRecord> GetMention(Transaction&, const std::string&) override;
  std::vector<model::MentionRecord>   ListMentions(Transaction&) override;

  Result                                   AddProtectionFlag(Transaction&, const model::ProtectionFlagRecord&) override;
  std::vector<model::ProtectionFlagRecord> ListProtectionFlags(Transaction&) override;

  Result                                  ClearResolution(Transaction&) override;
  Result                                  InsertEntity(Transaction&, const model::EntityRecord&) override;
  Result                                  InsertEntityMention(Transaction&, const model::EntityMentionRecord&) override;
  std::optional<model::EntityRecord>      GetEntity(Transaction&, const std::string&) override;
  std::vector<model::EntityRecord>        ListEntities(Transaction&) override;
  std::vector<model::EntityMentionRecord> ListEntityMentions(Transaction&) override;

  Result                                  AppendMergeDecision(Transaction&, const model::MergeDecisionRecord&) override;
  std::vector<model::MergeDecisionRecord> ListMergeDecisions(Transaction&, const std::string& run_id) override;

  Result                                   ClearReviewQueue(Transaction&) override;
  Result                                   InsertReviewItem(Transaction&, const model::ReviewItemRecord&) override;
  std::vector<model::ReviewItemRecord>     ListReviewItems(Transaction&) override;
  Result                                   UpsertReviewOverride(Transaction&, const model::ReviewOverrideRecord&) override;
  std::vector<model::ReviewOverrideRecord> ListReviewOverrides(Transaction&) override;

  Result                                     LatchSuppression(Transaction&, const model::SuppressionLatchRecord&) override;
  std::vector<model::SuppressionLatchRecord> ListSuppressionLatches(Transaction&) override;

  Result                          UpsertRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord> GetRun(Transaction&, const std::string&) override;
  std::optional<model::RunRecord> LatestCommittedRun(Transaction&) override;
  std::vector<model::RunRecord>   ListRuns(Transaction&) override;

 private:
  friend class MemoryTransaction;

  using PairKey = std::pair<std::string, std::string>;

  struct State {
    std::map<std::string, model::MentionRecord> mentions;
    std::vector<model::ProtectionFlagRecord>    protection_flags;

    std::map<std::string, model::EntityRecord>      entities;
    std::map<PairKey, model::EntityMentionRecord>   entity_mentions; // (entity_id, mention_id)
    std::unordered_map<std::string, std::string>    mention_to_entity;

    std::vector<model::MergeDecisionRecord>          merge_decisions;
    std::map<PairKey, model::ReviewItemRecord>       review_items;
    std::map<PairKey, model::ReviewOverrideRecord>   review_overrides;
    std::map<std::string, model::SuppressionLatchRecord> latches;

    std::map<std::string, model::RunRecord> runs;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace resolver::db::memory

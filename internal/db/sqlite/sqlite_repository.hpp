#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace resolver::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace resolver::db::sqlite

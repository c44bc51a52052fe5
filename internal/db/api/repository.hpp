#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/mention_record.hpp"
#include "internal/db/model/merge_decision_record.hpp"
#include "internal/db/model/review_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/suppression_record.hpp"

namespace resolver::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Mentions, protection flags, merge decisions and suppression latches
    are append-only: there is no update or delete path for them
  - The resolution output (entities, memberships, review queue) is
    replaced wholesale inside the run's transaction
  - List* calls return rows in a deterministic order (documented per call)

  The store is the source of truth for:
    mentions
    resolved partition
    audit trail
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Mentions (immutable)
  // ---------------------------------------------------------------------

  // AlreadyExists if the id is taken.
  virtual Result InsertMention(Transaction&, const model::MentionRecord&) = 0;

  virtual std::optional<model::MentionRecord> GetMention(Transaction&, const std::string& mention_id) = 0;

  // Ordered by mention_id.
  virtual std::vector<model::MentionRecord> ListMentions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Protection flags (append-only)
  // ---------------------------------------------------------------------

  virtual Result AddProtectionFlag(Transaction&, const model::ProtectionFlagRecord&) = 0;

  // Ordered by (mention_id, flagged_at_ms).
  virtual std::vector<model::ProtectionFlagRecord> ListProtectionFlags(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Resolved partition
  // ---------------------------------------------------------------------

  // Removes every entity and membership row. Only called inside a run
  // transaction right before the new partition is written.
  virtual Result ClearResolution(Transaction&) = 0;

  virtual Result InsertEntity(Transaction&, const model::EntityRecord&) = 0;

  virtual Result InsertEntityMention(Transaction&, const model::EntityMentionRecord&) = 0;

  virtual std::optional<model::EntityRecord> GetEntity(Transaction&, const std::string& entity_id) = 0;

  // Ordered by entity_id.
  virtual std::vector<model::EntityRecord> ListEntities(Transaction&) = 0;

  // Ordered by (entity_id, mention_id).
  virtual std::vector<model::EntityMentionRecord> ListEntityMentions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Audit trail (append-only)
  // ---------------------------------------------------------------------

  virtual Result AppendMergeDecision(Transaction&, const model::MergeDecisionRecord&) = 0;

  // Ordered by insertion. Empty run_id lists every run.
  virtual std::vector<model::MergeDecisionRecord> ListMergeDecisions(Transaction&, const std::string& run_id) = 0;

  // ---------------------------------------------------------------------
  // Manual review
  // ---------------------------------------------------------------------

  virtual Result ClearReviewQueue(Transaction&) = 0;

  virtual Result InsertReviewItem(Transaction&, const model::ReviewItemRecord&) = 0;

  // Ordered by (mention_id_a, mention_id_b).
  virtual std::vector<model::ReviewItemRecord> ListReviewItems(Transaction&) = 0;

  // Replaces an existing verdict for the same pair.
  virtual Result UpsertReviewOverride(Transaction&, const model::ReviewOverrideRecord&) = 0;

  // Ordered by (mention_id_a, mention_id_b).
  virtual std::vector<model::ReviewOverrideRecord> ListReviewOverrides(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Suppression latches (append-only, idempotent per mention)
  // ---------------------------------------------------------------------

  // Ok if the mention is already latched; the first latch is kept.
  virtual Result LatchSuppression(Transaction&, const model::SuppressionLatchRecord&) = 0;

  // Ordered by mention_id.
  virtual std::vector<model::SuppressionLatchRecord> ListSuppressionLatches(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Runs
  // ---------------------------------------------------------------------

  virtual Result UpsertRun(Transaction&, const model::RunRecord&) = 0;

  virtual std::optional<model::RunRecord> GetRun(Transaction&, const std::string& run_id) = 0;

  // Most recent committed run, by finished_at_ms.
  virtual std::optional<model::RunRecord> LatestCommittedRun(Transaction&) = 0;

  // Every run, aborted ones included. Ordered by (started_at_ms, run_id).
  virtual std::vector<model::RunRecord> ListRuns(Transaction&) = 0;
};

} // namespace resolver::db

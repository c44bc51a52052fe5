#include "internal/provenance/merge_decision_log.hpp"

#include <utility>

#include "internal/db/api/db_error.hpp"

namespace resolver::provenance {

MergeDecisionLog::MergeDecisionLog(db::Repository& repository, db::Transaction& tx, std::string run_id, bool log_discarded)
    : repository_(repository), tx_(tx), run_id_(std::move(run_id)), log_discarded_(log_discarded) {
}

db::model::MergeDecisionRecord MergeDecisionLog::ToRecord(const resolution::ClassifiedEdge& edge, const std::string& run_id,
                                                          uint64_t decided_at_ms) {
  db::model::MergeDecisionRecord record;
  record.run_id          = run_id;
  record.mention_id_a    = edge.pair.mention_id_a;
  record.mention_id_b    = edge.pair.mention_id_b;
  record.decision        = edge.decision;
  record.origin          = edge.pair.origin;
  record.composite_score = edge.pair.composite_score;
  record.signals         = edge.pair.signals;
  record.reason          = edge.reason;
  record.decided_at_ms   = decided_at_ms;
  return record;
}

std::size_t MergeDecisionLog::Append(const std::vector<resolution::ClassifiedEdge>& edges, uint64_t decided_at_ms) {
  std::size_t written = 0;
  for (const auto& edge : edges) {
    ++counts_[std::string(model::ToString(edge.decision))];
    if (edge.decision == model::EdgeDecision::kDiscard && !log_discarded_) continue;

    db::ThrowIfDbError(repository_.AppendMergeDecision(tx_, ToRecord(edge, run_id_, decided_at_ms)), "append merge decision");
    ++written;
  }
  return written;
}

} // namespace resolver::provenance

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/resolution/resolution_engine.hpp"

namespace resolver::provenance {

/*
  Writer for the append-only merge decision log of one run.

  Every Merge and Review decision is appended; Discards only when
  log_discarded is set. Rows go through the run transaction, so a run
  that aborts leaves no partial audit trail.
*/
class MergeDecisionLog {
 public:
  MergeDecisionLog(db::Repository& repository, db::Transaction& tx, std::string run_id, bool log_discarded);

  // Returns the number of rows written. Throws on store failure.
  std::size_t Append(const std::vector<resolution::ClassifiedEdge>& edges, uint64_t decided_at_ms);

  // Decisions seen by Append, logged or not, keyed by decision name.
  const std::map<std::string, std::uint64_t>& Counts() const {
    return counts_;
  }

  static db::model::MergeDecisionRecord ToRecord(const resolution::ClassifiedEdge& edge, const std::string& run_id,
                                                 uint64_t decided_at_ms);

 private:
  db::Repository&                      repository_;
  db::Transaction&                     tx_;
  std::string                          run_id_;
  bool                                 log_discarded_;
  std::map<std::string, std::uint64_t> counts_;
};

} // namespace resolver::provenance

#include "memory_repository.hpp"

#include <algorithm>
#include <iterator>

#include "memory_tx.hpp"

namespace resolver::db::memory {

namespace {

template <typename Map>
auto Values(const Map& map) {
  std::vector<typename Map::mapped_type> records;
  records.reserve(map.size());
  for (const auto& [_, record] : map) {
    records.push_back(record);
  }
  return records;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------
// Mentions
// ---------------------------------------------------------------------

Result MemoryRepository::InsertMention(Transaction& t, const model::MentionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.mentions.contains(r.mention_id)) return Result::Err(ErrorCode::AlreadyExists, "mention exists: " + r.mention_id);
  s.mentions[r.mention_id] = r;
  return Result::Ok();
}

std::optional<model::MentionRecord> MemoryRepository::GetMention(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.mentions.find(id);
  if (it == s.mentions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MentionRecord> MemoryRepository::ListMentions(Transaction& t) {
  return Values(TX(t).View().mentions);
}

// ---------------------------------------------------------------------
// Protection flags
// ---------------------------------------------------------------------

Result MemoryRepository::AddProtectionFlag(Transaction& t, const model::ProtectionFlagRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.mentions.contains(r.mention_id)) return Result::Err(ErrorCode::NotFound, "unknown mention: " + r.mention_id);
  s.protection_flags.push_back(r);
  return Result::Ok();
}

std::vector<model::ProtectionFlagRecord> MemoryRepository::ListProtectionFlags(Transaction& t) {
  auto flags = TX(t).View().protection_flags;
  std::stable_sort(flags.begin(), flags.end(), [](const auto& a, const auto& b) {
    if (a.mention_id != b.mention_id) return a.mention_id < b.mention_id;
    return a.flagged_at_ms < b.flagged_at_ms;
  });
  return flags;
}

// ---------------------------------------------------------------------
// Partition
// ---------------------------------------------------------------------

Result MemoryRepository::ClearResolution(Transaction& t) {
  auto& s = TX(t).Mutable();
  s.entities.clear();
  s.entity_mentions.clear();
  s.mention_to_entity.clear();
  return Result::Ok();
}

Result MemoryRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.entities.contains(r.entity_id)) return Result::Err(ErrorCode::AlreadyExists, "entity exists: " + r.entity_id);
  s.entities[r.entity_id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertEntityMention(Transaction& t, const model::EntityMentionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.entities.contains(r.entity_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown entity: " + r.entity_id);
  // a mention belongs to exactly one entity
  if (s.mention_to_entity.contains(r.mention_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "mention already assigned: " + r.mention_id);
  }
  s.entity_mentions[{r.entity_id, r.mention_id}] = r;
  s.mention_to_entity[r.mention_id]              = r.entity_id;
  return Result::Ok();
}

std::optional<model::EntityRecord> MemoryRepository::GetEntity(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.entities.find(id);
  if (it == s.entities.end()) return std::nullopt;
  return it->second;
}

std::vector<model::EntityRecord> MemoryRepository::ListEntities(Transaction& t) {
  return Values(TX(t).View().entities);
}

std::vector<model::EntityMentionRecord> MemoryRepository::ListEntityMentions(Transaction& t) {
  return Values(TX(t).View().entity_mentions);
}

// ---------------------------------------------------------------------
// Audit
// ---------------------------------------------------------------------

Result MemoryRepository::AppendMergeDecision(Transaction& t, const model::MergeDecisionRecord& r) {
  TX(t).Mutable().merge_decisions.push_back(r);
  return Result::Ok();
}

std::vector<model::MergeDecisionRecord> MemoryRepository::ListMergeDecisions(Transaction& t, const std::string& run_id) {
  const auto& all = TX(t).View().merge_decisions;
  if (run_id.empty()) return all;

  std::vector<model::MergeDecisionRecord> out;
  std::copy_if(all.begin(), all.end(), std::back_inserter(out), [&](const auto& d) { return d.run_id == run_id; });
  return out;
}

// ---------------------------------------------------------------------
// Review
// ---------------------------------------------------------------------

Result MemoryRepository::ClearReviewQueue(Transaction& t) {
  TX(t).Mutable().review_items.clear();
  return Result::Ok();
}

Result MemoryRepository::InsertReviewItem(Transaction& t, const model::ReviewItemRecord& r) {
  TX(t).Mutable().review_items[{r.mention_id_a, r.mention_id_b}] = r;
  return Result::Ok();
}

std::vector<model::ReviewItemRecord> MemoryRepository::ListReviewItems(Transaction& t) {
  return Values(TX(t).View().review_items);
}

Result MemoryRepository::UpsertReviewOverride(Transaction& t, const model::ReviewOverrideRecord& r) {
  TX(t).Mutable().review_overrides[{r.mention_id_a, r.mention_id_b}] = r;
  return Result::Ok();
}

std::vector<model::ReviewOverrideRecord> MemoryRepository::ListReviewOverrides(Transaction& t) {
  return Values(TX(t).View().review_overrides);
}

// ---------------------------------------------------------------------
// Suppression latches
// ---------------------------------------------------------------------

Result MemoryRepository::LatchSuppression(Transaction& t, const model::SuppressionLatchRecord& r) {
  TX(t).Mutable().latches.try_emplace(r.mention_id, r);
  return Result::Ok();
}

std::vector<model::SuppressionLatchRecord> MemoryRepository::ListSuppressionLatches(Transaction& t) {
  return Values(TX(t).View().latches);
}

// ---------------------------------------------------------------------
// Runs
// ---------------------------------------------------------------------

Result MemoryRepository::UpsertRun(Transaction& t, const model::RunRecord& r) {
  TX(t).Mutable().runs[r.run_id] = r;
  return Result::Ok();
}

std::optional<model::RunRecord> MemoryRepository::GetRun(Transaction& t, const std::string& run_id) {
  const auto& s  = TX(t).View();
  auto        it = s.runs.find(run_id);
  if (it == s.runs.end()) return std::nullopt;
  return it->second;
}

std::optional<model::RunRecord> MemoryRepository::LatestCommittedRun(Transaction& t) {
  std::optional<model::RunRecord> latest;
  for (const auto& [_, run] : TX(t).View().runs) {
    if (run.status != model::RunStatus::kCommitted) continue;
    if (!latest || run.finished_at_ms > latest->finished_at_ms ||
        (run.finished_at_ms == latest->finished_at_ms && run.run_id > latest->run_id)) {
      latest = run;
    }
  }
  return latest;
}

std::vector<model::RunRecord> MemoryRepository::ListRuns(Transaction& t) {
  auto runs = Values(TX(t).View().runs);
  std::sort(runs.begin(), runs.end(), [](const model::RunRecord& a, const model::RunRecord& b) {
    if (a.started_at_ms != b.started_at_ms) return a.started_at_ms < b.started_at_ms;
    return a.run_id < b.run_id;
  });
  return runs;
}

} // namespace resolver::db::memory

#include "pg_repository.hpp"

#include <cstddef>
#include <cstring>

#include "internal/db/sql/embedding_codec.hpp"

namespace resolver::db::postgres {

namespace {

using Bytes = std::basic_string<std::byte>;

Bytes EncodeEmbedding(const std::vector<float>& v) {
  const auto encoded = sql::EncodeEmbedding(v);
  Bytes      out(encoded.size(), std::byte{0});
  if (!encoded.empty()) std::memcpy(out.data(), encoded.data(), encoded.size());
  return out;
}

std::vector<float> DecodeEmbedding(const pqxx::field& f) {
  if (f.is_null()) return {};
  auto raw = f.as<Bytes>();
  return sql::DecodeEmbedding(raw.data(), raw.size());
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

constexpr const char* kMentionColumns =
    "mention_id,source_reference,source_system,raw_name,name_prefix,name_given,name_middle,name_family,name_suffix,name_nickname,"
    "parse_type,parse_confidence,parse_failed,placeholder,blocking_key,blocking_key_version,embedding,embedding_model,ingested_at_ms";

model::MentionRecord ReadMention(const pqxx::row& row) {
  model::MentionRecord r;
  r.mention_id           = row[0].c_str();
  r.source_reference     = row[1].c_str();
  r.source_system        = row[2].c_str();
  r.raw_name             = row[3].c_str();
  r.name.prefix          = OptText(row[4]);
  r.name.given           = OptText(row[5]);
  r.name.middle          = OptText(row[6]);
  r.name.family          = OptText(row[7]);
  r.name.suffix          = OptText(row[8]);
  r.name.nickname        = OptText(row[9]);
  r.parse_type           = static_cast<resolver::model::ParseType>(row[10].as<int>());
  r.parse_confidence     = row[11].as<double>();
  r.parse_failed         = row[12].as<bool>();
  r.placeholder          = row[13].as<bool>();
  r.blocking_key         = row[14].c_str();
  r.blocking_key_version = row[15].c_str();
  r.embedding            = DecodeEmbedding(row[16]);
  r.embedding_model      = row[17].c_str();
  r.ingested_at_ms       = row[18].as<uint64_t>();
  return r;
}

constexpr const char* kEntityColumns =
    "entity_id,canonical_name,canonical_mention_id,entity_type,is_verified,suppress_from_public,confidence,suppression_reasons,run_id,resolved_at_ms";

model::EntityRecord ReadEntity(const pqxx::row& row) {
  model::EntityRecord r;
  r.entity_id            = row[0].c_str();
  r.canonical_name       = row[1].c_str();
  r.canonical_mention_id = row[2].c_str();
  r.entity_type          = static_cast<resolver::model::ParseType>(row[3].as<int>());
  r.is_verified          = row[4].as<bool>();
  r.suppress_from_public = row[5].as<bool>();
  r.confidence           = row[6].as<double>();
  r.suppression_reasons  = row[7].c_str();
  r.run_id               = row[8].c_str();
  r.resolved_at_ms       = row[9].as<uint64_t>();
  return r;
}

constexpr const char* kRunColumns = "run_id,started_at_ms,finished_at_ms,status,config_fingerprint,report_json";

model::RunRecord ReadRun(const pqxx::row& row) {
  model::RunRecord r;
  r.run_id             = row[0].c_str();
  r.started_at_ms      = row[1].as<uint64_t>();
  r.finished_at_ms     = row[2].as<uint64_t>();
  r.status             = static_cast<model::RunStatus>(row[3].as<int>());
  r.config_fingerprint = row[4].c_str();
  r.report_json        = row[5].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Mentions
// ------------------------------------------------------------------

Result PgRepository::InsertMention(Transaction& t, const model::MentionRecord& r) {
  try {
    std::optional<Bytes> embedding;
    if (!r.embedding.empty()) embedding = EncodeEmbedding(r.embedding);

    TX(t).Work().exec_prepared("insert_mention", r.mention_id, r.source_reference, r.source_system, r.raw_name, r.name.prefix,
                               r.name.given, r.name.middle, r.name.family, r.name.suffix, r.name.nickname, static_cast<int>(r.parse_type),
                               r.parse_confidence, r.parse_failed, r.placeholder, r.blocking_key, r.blocking_key_version, embedding,
                               r.embedding_model, r.ingested_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MentionRecord> PgRepository::GetMention(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kMentionColumns + " FROM mentions WHERE mention_id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadMention(res[0]);
}

std::vector<model::MentionRecord> PgRepository::ListMentions(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kMentionColumns + " FROM mentions ORDER BY mention_id;");

  std::vector<model::MentionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadMention(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Protection flags
// ------------------------------------------------------------------

Result PgRepository::AddProtectionFlag(Transaction& t, const model::ProtectionFlagRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO protection_flags(mention_id,reason,flagged_at_ms) VALUES($1,$2,$3);", r.mention_id, r.reason,
                             r.flagged_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ProtectionFlagRecord> PgRepository::ListProtectionFlags(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT mention_id,reason,flagged_at_ms FROM protection_flags ORDER BY mention_id,flagged_at_ms,ctid;");

  std::vector<model::ProtectionFlagRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ProtectionFlagRecord r;
    r.mention_id    = row[0].c_str();
    r.reason        = row[1].c_str();
    r.flagged_at_ms = row[2].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Partition
// ------------------------------------------------------------------

Result PgRepository::ClearResolution(Transaction& t) {
  try {
    TX(t).Work().exec("DELETE FROM entity_mentions;");
    TX(t).Work().exec("DELETE FROM entities;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_entity", r.entity_id, r.canonical_name, r.canonical_mention_id, static_cast<int>(r.entity_type),
                               r.is_verified, r.suppress_from_public, r.confidence, r.suppression_reasons, r.run_id, r.resolved_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertEntityMention(Transaction& t, const model::EntityMentionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_entity_mention", r.entity_id, r.mention_id, r.composite_score);
    return Result::Ok();
  } catch (const pqxx::integrity_constraint_violation& e) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EntityRecord> PgRepository::GetEntity(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kEntityColumns + " FROM entities WHERE entity_id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadEntity(res[0]);
}

std::vector<model::EntityRecord> PgRepository::ListEntities(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kEntityColumns + " FROM entities ORDER BY entity_id;");

  std::vector<model::EntityRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEntity(row));
  }
  return out;
}

std::vector<model::EntityMentionRecord> PgRepository::ListEntityMentions(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT entity_id,mention_id,composite_score FROM entity_mentions ORDER BY entity_id,mention_id;");

  std::vector<model::EntityMentionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::EntityMentionRecord r;
    r.entity_id       = row[0].c_str();
    r.mention_id      = row[1].c_str();
    r.composite_score = row[2].as<double>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result PgRepository::AppendMergeDecision(Transaction& t, const model::MergeDecisionRecord& r) {
  try {
    const auto& s = r.signals;
    TX(t).Work().exec_prepared("append_merge_decision", r.run_id, r.mention_id_a, r.mention_id_b, static_cast<int>(r.decision),
                               static_cast<int>(r.origin), r.composite_score, s.phonetic_match, s.edit_similarity, s.embedding_similarity,
                               static_cast<int>(s.type_agreement), s.low_confidence, s.parse_failed, s.capped, r.reason, r.decided_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::MergeDecisionRecord> PgRepository::ListMergeDecisions(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT run_id,mention_id_a,mention_id_b,decision,origin,composite_score,phonetic_match,edit_similarity,"
      "embedding_similarity,type_agreement,low_confidence,parse_failed,capped,reason,decided_at_ms"
      " FROM merge_decisions WHERE ($1 = '' OR run_id = $1) ORDER BY seq;",
      run_id);

  std::vector<model::MergeDecisionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::MergeDecisionRecord r;
    r.run_id                  = row[0].c_str();
    r.mention_id_a            = row[1].c_str();
    r.mention_id_b            = row[2].c_str();
    r.decision                = static_cast<resolver::model::EdgeDecision>(row[3].as<int>());
    r.origin                  = static_cast<resolver::model::CandidateOrigin>(row[4].as<int>());
    r.composite_score         = row[5].as<double>();
    r.signals.phonetic_match  = row[6].as<bool>();
    r.signals.edit_similarity = row[7].as<double>();
    if (!row[8].is_null()) r.signals.embedding_similarity = row[8].as<double>();
    r.signals.type_agreement = static_cast<resolver::model::TypeAgreement>(row[9].as<int>());
    r.signals.low_confidence = row[10].as<bool>();
    r.signals.parse_failed   = row[11].as<bool>();
    r.signals.capped         = row[12].as<bool>();
    r.reason                 = row[13].c_str();
    r.decided_at_ms          = row[14].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Review
// ------------------------------------------------------------------

Result PgRepository::ClearReviewQueue(Transaction& t) {
  try {
    TX(t).Work().exec("DELETE FROM review_items;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertReviewItem(Transaction& t, const model::ReviewItemRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO review_items(mention_id_a,mention_id_b,run_id,composite_score,origin) VALUES($1,$2,$3,$4,$5)"
        " ON CONFLICT(mention_id_a,mention_id_b) DO UPDATE SET run_id=EXCLUDED.run_id,"
        " composite_score=EXCLUDED.composite_score, origin=EXCLUDED.origin;",
        r.mention_id_a, r.mention_id_b, r.run_id, r.composite_score, static_cast<int>(r.origin));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ReviewItemRecord> PgRepository::ListReviewItems(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT mention_id_a,mention_id_b,run_id,composite_score,origin FROM review_items ORDER BY mention_id_a,mention_id_b;");

  std::vector<model::ReviewItemRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ReviewItemRecord r;
    r.mention_id_a    = row[0].c_str();
    r.mention_id_b    = row[1].c_str();
    r.run_id          = row[2].c_str();
    r.composite_score = row[3].as<double>();
    r.origin          = static_cast<resolver::model::CandidateOrigin>(row[4].as<int>());
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::UpsertReviewOverride(Transaction& t, const model::ReviewOverrideRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO review_overrides(mention_id_a,mention_id_b,verdict,reviewer,note,decided_at_ms) VALUES($1,$2,$3,$4,$5,$6)"
        " ON CONFLICT(mention_id_a,mention_id_b) DO UPDATE SET verdict=EXCLUDED.verdict, reviewer=EXCLUDED.reviewer,"
        " note=EXCLUDED.note, decided_at_ms=EXCLUDED.decided_at_ms;",
        r.mention_id_a, r.mention_id_b, static_cast<int>(r.verdict), r.reviewer, r.note, r.decided_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ReviewOverrideRecord> PgRepository::ListReviewOverrides(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT mention_id_a,mention_id_b,verdict,reviewer,note,decided_at_ms FROM review_overrides ORDER BY mention_id_a,mention_id_b;");

  std::vector<model::ReviewOverrideRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ReviewOverrideRecord r;
    r.mention_id_a  = row[0].c_str();
    r.mention_id_b  = row[1].c_str();
    r.verdict       = static_cast<model::ReviewVerdict>(row[2].as<int>());
    r.reviewer      = row[3].c_str();
    r.note          = row[4].c_str();
    r.decided_at_ms = row[5].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Suppression latches
// ------------------------------------------------------------------

Result PgRepository::LatchSuppression(Transaction& t, const model::SuppressionLatchRecord& r) {
  try {
    TX(t).Work().exec_prepared("latch_suppression", r.mention_id, r.reason, r.run_id, r.latched_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SuppressionLatchRecord> PgRepository::ListSuppressionLatches(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT mention_id,reason,run_id,latched_at_ms FROM suppression_latches ORDER BY mention_id;");

  std::vector<model::SuppressionLatchRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::SuppressionLatchRecord r;
    r.mention_id    = row[0].c_str();
    r.reason        = row[1].c_str();
    r.run_id        = row[2].c_str();
    r.latched_at_ms = row[3].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result PgRepository::UpsertRun(Transaction& t, const model::RunRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO runs(run_id,started_at_ms,finished_at_ms,status,config_fingerprint,report_json) VALUES($1,$2,$3,$4,$5,$6)"
        " ON CONFLICT(run_id) DO UPDATE SET finished_at_ms=EXCLUDED.finished_at_ms, status=EXCLUDED.status,"
        " config_fingerprint=EXCLUDED.config_fingerprint, report_json=EXCLUDED.report_json;",
        r.run_id, r.started_at_ms, r.finished_at_ms, static_cast<int>(r.status), r.config_fingerprint, r.report_json);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RunRecord> PgRepository::GetRun(Transaction& t, const std::string& run_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRunColumns + " FROM runs WHERE run_id=$1;", run_id);
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

std::optional<model::RunRecord> PgRepository::LatestCommittedRun(Transaction& t) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kRunColumns + " FROM runs WHERE status=$1 ORDER BY finished_at_ms DESC, run_id DESC LIMIT 1;",
      static_cast<int>(model::RunStatus::kCommitted));
  if (res.empty()) return std::nullopt;
  return ReadRun(res[0]);
}

std::vector<model::RunRecord> PgRepository::ListRuns(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kRunColumns + " FROM runs ORDER BY started_at_ms, run_id;");

  std::vector<model::RunRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadRun(row));
  return out;
}

} // namespace resolver::db::postgres

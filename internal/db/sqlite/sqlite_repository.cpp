#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/embedding_codec.hpp"

namespace resolver::db::sqlite {

using resolver::db::ErrorCode;
using resolver::db::Result;

namespace {

// Finalizes on scope exit. Prepare failures throw: a statement that does
// not compile against the bootstrapped schema is a programming error.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      std::string msg = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw std::runtime_error("sqlite prepare: " + msg);
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  int Step() {
    return sqlite3_step(st_);
  }

  // Step a query; SQLITE_ROW -> true, SQLITE_DONE -> false, else throw.
  bool Next() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindEmbedding(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
  if (v.empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  const auto bytes = sql::EncodeEmbedding(v);
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

std::vector<float> ColEmbedding(sqlite3_stmt* st, int col) {
  const void* blob  = sqlite3_column_blob(st, col);
  const int   bytes = sqlite3_column_bytes(st, col);
  if (!blob || bytes <= 0) return {};
  return sql::DecodeEmbedding(blob, static_cast<std::size_t>(bytes));
}

constexpr const char* kMentionColumns =
    "mention_id,source_reference,source_system,raw_name,name_prefix,name_given,name_middle,name_family,name_suffix,name_nickname,"
    "parse_type,parse_confidence,parse_failed,placeholder,blocking_key,blocking_key_version,embedding,embedding_model,ingested_at_ms";

model::MentionRecord ReadMention(sqlite3_stmt* st) {
  model::MentionRecord r;
  r.mention_id           = ColText(st, 0);
  r.source_reference     = ColText(st, 1);
  r.source_system        = ColText(st, 2);
  r.raw_name             = ColText(st, 3);
  r.name.prefix          = ColOptText(st, 4);
  r.name.given           = ColOptText(st, 5);
  r.name.middle          = ColOptText(st, 6);
  r.name.family          = ColOptText(st, 7);
  r.name.suffix          = ColOptText(st, 8);
  r.name.nickname        = ColOptText(st, 9);
  r.parse_type           = static_cast<resolver::model::ParseType>(ColI32(st, 10));
  r.parse_confidence     = ColDouble(st, 11);
  r.parse_failed         = ColI32(st, 12) != 0;
  r.placeholder          = ColI32(st, 13) != 0;
  r.blocking_key         = ColText(st, 14);
  r.blocking_key_version = ColText(st, 15);
  r.embedding            = ColEmbedding(st, 16);
  r.embedding_model      = ColText(st, 17);
  r.ingested_at_ms       = ColU64(st, 18);
  return r;
}

constexpr const char* kEntityColumns =
    "entity_id,canonical_name,canonical_mention_id,entity_type,is_verified,suppress_from_public,confidence,suppression_reasons,run_id,resolved_at_ms";

model::EntityRecord ReadEntity(sqlite3_stmt* st) {
  model::EntityRecord r;
  r.entity_id            = ColText(st, 0);
  r.canonical_name       = ColText(st, 1);
  r.canonical_mention_id = ColText(st, 2);
  r.entity_type          = static_cast<resolver::model::ParseType>(ColI32(st, 3));
  r.is_verified          = ColI32(st, 4) != 0;
  r.suppress_from_public = ColI32(st, 5) != 0;
  r.confidence           = ColDouble(st, 6);
  r.suppression_reasons  = ColText(st, 7);
  r.run_id               = ColText(st, 8);
  r.resolved_at_ms       = ColU64(st, 9);
  return r;
}

constexpr const char* kRunColumns = "run_id,started_at_ms,finished_at_ms,status,config_fingerprint,report_json";

model::RunRecord ReadRun(sqlite3_stmt* st) {
  model::RunRecord r;
  r.run_id             = ColText(st, 0);
  r.started_at_ms      = ColU64(st, 1);
  r.finished_at_ms     = ColU64(st, 2);
  r.status             = static_cast<model::RunStatus>(ColI32(st, 3));
  r.config_fingerprint = ColText(st, 4);
  r.report_json        = ColText(st, 5);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Mentions
// ------------------------------------------------------------------

Result SqliteRepository::InsertMention(Transaction& t, const model::MentionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO mentions(mention_id,source_reference,source_system,raw_name,name_prefix,name_given,name_middle,name_family,"
               "name_suffix,name_nickname,parse_type,parse_confidence,parse_failed,placeholder,blocking_key,blocking_key_version,"
               "embedding,embedding_model,ingested_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");

  BindText(st.get(), 1, r.mention_id);
  BindText(st.get(), 2, r.source_reference);
  BindText(st.get(), 3, r.source_system);
  BindText(st.get(), 4, r.raw_name);
  BindOptText(st.get(), 5, r.name.prefix);
  BindOptText(st.get(), 6, r.name.given);
  BindOptText(st.get(), 7, r.name.middle);
  BindOptText(st.get(), 8, r.name.family);
  BindOptText(st.get(), 9, r.name.suffix);
  BindOptText(st.get(), 10, r.name.nickname);
  BindI32(st.get(), 11, static_cast<int>(r.parse_type));
  BindDouble(st.get(), 12, r.parse_confidence);
  BindI32(st.get(), 13, r.parse_failed ? 1 : 0);
  BindI32(st.get(), 14, r.placeholder ? 1 : 0);
  BindText(st.get(), 15, r.blocking_key);
  BindText(st.get(), 16, r.blocking_key_version);
  BindEmbedding(st.get(), 17, r.embedding);
  BindText(st.get(), 18, r.embedding_model);
  BindU64(st.get(), 19, r.ingested_at_ms);

  return Translate(db, st.Step());
}

std::optional<model::MentionRecord> SqliteRepository::GetMention(Transaction& t, const std::string& id) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kMentionColumns + " FROM mentions WHERE mention_id=?;";

  Statement st(db, sql.c_str());
  BindText(st.get(), 1, id);
  if (!st.Next()) return std::nullopt;
  return ReadMention(st.get());
}

std::vector<model::MentionRecord> SqliteRepository::ListMentions(Transaction& t) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kMentionColumns + " FROM mentions ORDER BY mention_id;";

  Statement                         st(db, sql.c_str());
  std::vector<model::MentionRecord> out;
  while (st.Next()) {
    out.push_back(ReadMention(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Protection flags
// ------------------------------------------------------------------

Result SqliteRepository::AddProtectionFlag(Transaction& t, const model::ProtectionFlagRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO protection_flags(mention_id,reason,flagged_at_ms) VALUES(?,?,?);");
  BindText(st.get(), 1, r.mention_id);
  BindText(st.get(), 2, r.reason);
  BindU64(st.get(), 3, r.flagged_at_ms);

  int rc = st.Step();
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::NotFound, "unknown mention: " + r.mention_id);
  }
  return Translate(db, rc);
}

std::vector<model::ProtectionFlagRecord> SqliteRepository::ListProtectionFlags(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT mention_id,reason,flagged_at_ms FROM protection_flags ORDER BY mention_id,flagged_at_ms,rowid;");

  std::vector<model::ProtectionFlagRecord> out;
  while (st.Next()) {
    model::ProtectionFlagRecord r;
    r.mention_id    = ColText(st.get(), 0);
    r.reason        = ColText(st.get(), 1);
    r.flagged_at_ms = ColU64(st.get(), 2);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Partition
// ------------------------------------------------------------------

Result SqliteRepository::ClearResolution(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement members(db, "DELETE FROM entity_mentions;");
  auto      res = Translate(db, members.Step());
  if (!res) return res;

  Statement entities(db, "DELETE FROM entities;");
  return Translate(db, entities.Step());
}

Result SqliteRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO entities(entity_id,canonical_name,canonical_mention_id,entity_type,is_verified,suppress_from_public,"
               "confidence,suppression_reasons,run_id,resolved_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.entity_id);
  BindText(st.get(), 2, r.canonical_name);
  BindText(st.get(), 3, r.canonical_mention_id);
  BindI32(st.get(), 4, static_cast<int>(r.entity_type));
  BindI32(st.get(), 5, r.is_verified ? 1 : 0);
  BindI32(st.get(), 6, r.suppress_from_public ? 1 : 0);
  BindDouble(st.get(), 7, r.confidence);
  BindText(st.get(), 8, r.suppression_reasons);
  BindText(st.get(), 9, r.run_id);
  BindU64(st.get(), 10, r.resolved_at_ms);

  return Translate(db, st.Step());
}

Result SqliteRepository::InsertEntityMention(Transaction& t, const model::EntityMentionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO entity_mentions(entity_id,mention_id,composite_score) VALUES(?,?,?);");
  BindText(st.get(), 1, r.entity_id);
  BindText(st.get(), 2, r.mention_id);
  BindDouble(st.get(), 3, r.composite_score);

  int rc = st.Step();
  // a second membership for the same mention is a partition violation,
  // not a duplicate insert
  if ((rc & 0xff) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
  }
  return Translate(db, rc);
}

std::optional<model::EntityRecord> SqliteRepository::GetEntity(Transaction& t, const std::string& id) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kEntityColumns + " FROM entities WHERE entity_id=?;";

  Statement st(db, sql.c_str());
  BindText(st.get(), 1, id);
  if (!st.Next()) return std::nullopt;
  return ReadEntity(st.get());
}

std::vector<model::EntityRecord> SqliteRepository::ListEntities(Transaction& t) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kEntityColumns + " FROM entities ORDER BY entity_id;";

  Statement                        st(db, sql.c_str());
  std::vector<model::EntityRecord> out;
  while (st.Next()) {
    out.push_back(ReadEntity(st.get()));
  }
  return out;
}

std::vector<model::EntityMentionRecord> SqliteRepository::ListEntityMentions(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT entity_id,mention_id,composite_score FROM entity_mentions ORDER BY entity_id,mention_id;");

  std::vector<model::EntityMentionRecord> out;
  while (st.Next()) {
    model::EntityMentionRecord r;
    r.entity_id       = ColText(st.get(), 0);
    r.mention_id      = ColText(st.get(), 1);
    r.composite_score = ColDouble(st.get(), 2);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::AppendMergeDecision(Transaction& t, const model::MergeDecisionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO merge_decisions(run_id,mention_id_a,mention_id_b,decision,origin,composite_score,phonetic_match,"
               "edit_similarity,embedding_similarity,type_agreement,low_confidence,parse_failed,capped,reason,decided_at_ms)"
               " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.run_id);
  BindText(st.get(), 2, r.mention_id_a);
  BindText(st.get(), 3, r.mention_id_b);
  BindI32(st.get(), 4, static_cast<int>(r.decision));
  BindI32(st.get(), 5, static_cast<int>(r.origin));
  BindDouble(st.get(), 6, r.composite_score);
  BindI32(st.get(), 7, r.signals.phonetic_match ? 1 : 0);
  BindDouble(st.get(), 8, r.signals.edit_similarity);
  if (r.signals.embedding_similarity) {
    BindDouble(st.get(), 9, *r.signals.embedding_similarity);
  } else {
    sqlite3_bind_null(st.get(), 9);
  }
  BindI32(st.get(), 10, static_cast<int>(r.signals.type_agreement));
  BindI32(st.get(), 11, r.signals.low_confidence ? 1 : 0);
  BindI32(st.get(), 12, r.signals.parse_failed ? 1 : 0);
  BindI32(st.get(), 13, r.signals.capped ? 1 : 0);
  BindText(st.get(), 14, r.reason);
  BindU64(st.get(), 15, r.decided_at_ms);

  return Translate(db, st.Step());
}

std::vector<model::MergeDecisionRecord> SqliteRepository::ListMergeDecisions(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT run_id,mention_id_a,mention_id_b,decision,origin,composite_score,phonetic_match,edit_similarity,"
               "embedding_similarity,type_agreement,low_confidence,parse_failed,capped,reason,decided_at_ms"
               " FROM merge_decisions WHERE (?1 = '' OR run_id = ?1) ORDER BY seq;");
  BindText(st.get(), 1, run_id);

  std::vector<model::MergeDecisionRecord> out;
  while (st.Next()) {
    auto*                      s = st.get();
    model::MergeDecisionRecord r;
    r.run_id                  = ColText(s, 0);
    r.mention_id_a            = ColText(s, 1);
    r.mention_id_b            = ColText(s, 2);
    r.decision                = static_cast<resolver::model::EdgeDecision>(ColI32(s, 3));
    r.origin                  = static_cast<resolver::model::CandidateOrigin>(ColI32(s, 4));
    r.composite_score         = ColDouble(s, 5);
    r.signals.phonetic_match  = ColI32(s, 6) != 0;
    r.signals.edit_similarity = ColDouble(s, 7);
    if (sqlite3_column_type(s, 8) != SQLITE_NULL) {
      r.signals.embedding_similarity = ColDouble(s, 8);
    }
    r.signals.type_agreement = static_cast<resolver::model::TypeAgreement>(ColI32(s, 9));
    r.signals.low_confidence = ColI32(s, 10) != 0;
    r.signals.parse_failed   = ColI32(s, 11) != 0;
    r.signals.capped         = ColI32(s, 12) != 0;
    r.reason                 = ColText(s, 13);
    r.decided_at_ms          = ColU64(s, 14);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Review
// ------------------------------------------------------------------

Result SqliteRepository::ClearReviewQueue(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM review_items;");
  return Translate(db, st.Step());
}

Result SqliteRepository::InsertReviewItem(Transaction& t, const model::ReviewItemRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO review_items(mention_id_a,mention_id_b,run_id,composite_score,origin) VALUES(?,?,?,?,?)"
               " ON CONFLICT(mention_id_a,mention_id_b) DO UPDATE SET run_id=excluded.run_id,"
               " composite_score=excluded.composite_score, origin=excluded.origin;");
  BindText(st.get(), 1, r.mention_id_a);
  BindText(st.get(), 2, r.mention_id_b);
  BindText(st.get(), 3, r.run_id);
  BindDouble(st.get(), 4, r.composite_score);
  BindI32(st.get(), 5, static_cast<int>(r.origin));

  return Translate(db, st.Step());
}

std::vector<model::ReviewItemRecord> SqliteRepository::ListReviewItems(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT mention_id_a,mention_id_b,run_id,composite_score,origin FROM review_items ORDER BY mention_id_a,mention_id_b;");

  std::vector<model::ReviewItemRecord> out;
  while (st.Next()) {
    model::ReviewItemRecord r;
    r.mention_id_a    = ColText(st.get(), 0);
    r.mention_id_b    = ColText(st.get(), 1);
    r.run_id          = ColText(st.get(), 2);
    r.composite_score = ColDouble(st.get(), 3);
    r.origin          = static_cast<resolver::model::CandidateOrigin>(ColI32(st.get(), 4));
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::UpsertReviewOverride(Transaction& t, const model::ReviewOverrideRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO review_overrides(mention_id_a,mention_id_b,verdict,reviewer,note,decided_at_ms) VALUES(?,?,?,?,?,?)"
               " ON CONFLICT(mention_id_a,mention_id_b) DO UPDATE SET verdict=excluded.verdict, reviewer=excluded.reviewer,"
               " note=excluded.note, decided_at_ms=excluded.decided_at_ms;");
  BindText(st.get(), 1, r.mention_id_a);
  BindText(st.get(), 2, r.mention_id_b);
  BindI32(st.get(), 3, static_cast<int>(r.verdict));
  BindText(st.get(), 4, r.reviewer);
  BindText(st.get(), 5, r.note);
  BindU64(st.get(), 6, r.decided_at_ms);

  return Translate(db, st.Step());
}

std::vector<model::ReviewOverrideRecord> SqliteRepository::ListReviewOverrides(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT mention_id_a,mention_id_b,verdict,reviewer,note,decided_at_ms FROM review_overrides"
               " ORDER BY mention_id_a,mention_id_b;");

  std::vector<model::ReviewOverrideRecord> out;
  while (st.Next()) {
    model::ReviewOverrideRecord r;
    r.mention_id_a  = ColText(st.get(), 0);
    r.mention_id_b  = ColText(st.get(), 1);
    r.verdict       = static_cast<model::ReviewVerdict>(ColI32(st.get(), 2));
    r.reviewer      = ColText(st.get(), 3);
    r.note          = ColText(st.get(), 4);
    r.decided_at_ms = ColU64(st.get(), 5);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Suppression latches
// ------------------------------------------------------------------

Result SqliteRepository::LatchSuppression(Transaction& t, const model::SuppressionLatchRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO suppression_latches(mention_id,reason,run_id,latched_at_ms) VALUES(?,?,?,?)"
               " ON CONFLICT(mention_id) DO NOTHING;");
  BindText(st.get(), 1, r.mention_id);
  BindText(st.get(), 2, r.reason);
  BindText(st.get(), 3, r.run_id);
  BindU64(st.get(), 4, r.latched_at_ms);

  return Translate(db, st.Step());
}

std::vector<model::SuppressionLatchRecord> SqliteRepository::ListSuppressionLatches(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT mention_id,reason,run_id,latched_at_ms FROM suppression_latches ORDER BY mention_id;");

  std::vector<model::SuppressionLatchRecord> out;
  while (st.Next()) {
    model::SuppressionLatchRecord r;
    r.mention_id    = ColText(st.get(), 0);
    r.reason        = ColText(st.get(), 1);
    r.run_id        = ColText(st.get(), 2);
    r.latched_at_ms = ColU64(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO runs(run_id,started_at_ms,finished_at_ms,status,config_fingerprint,report_json) VALUES(?,?,?,?,?,?)"
               " ON CONFLICT(run_id) DO UPDATE SET finished_at_ms=excluded.finished_at_ms, status=excluded.status,"
               " config_fingerprint=excluded.config_fingerprint, report_json=excluded.report_json;");
  BindText(st.get(), 1, r.run_id);
  BindU64(st.get(), 2, r.started_at_ms);
  BindU64(st.get(), 3, r.finished_at_ms);
  BindI32(st.get(), 4, static_cast<int>(r.status));
  BindText(st.get(), 5, r.config_fingerprint);
  BindText(st.get(), 6, r.report_json);

  return Translate(db, st.Step());
}

std::optional<model::RunRecord> SqliteRepository::GetRun(Transaction& t, const std::string& run_id) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kRunColumns + " FROM runs WHERE run_id=?;";

  Statement st(db, sql.c_str());
  BindText(st.get(), 1, run_id);
  if (!st.Next()) return std::nullopt;
  return ReadRun(st.get());
}

std::optional<model::RunRecord> SqliteRepository::LatestCommittedRun(Transaction& t) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kRunColumns + " FROM runs WHERE status=? ORDER BY finished_at_ms DESC, run_id DESC LIMIT 1;";

  Statement st(db, sql.c_str());
  BindI32(st.get(), 1, static_cast<int>(model::RunStatus::kCommitted));
  if (!st.Next()) return std::nullopt;
  return ReadRun(st.get());
}

std::vector<model::RunRecord> SqliteRepository::ListRuns(Transaction& t) {
  auto*       db  = TX(t).Handle();
  std::string sql = std::string("SELECT ") + kRunColumns + " FROM runs ORDER BY started_at_ms, run_id;";

  Statement st(db, sql.c_str());

  std::vector<model::RunRecord> out;
  while (st.Next()) out.push_back(ReadRun(st.get()));
  return out;
}

} // namespace resolver::db::sqlite

#pragma once

#include <string>
#include <vector>

namespace resolver::db::sql {

/*
  Store layout shared by the sqlite and postgres backends.

  Append-only tables (mentions, protection_flags, merge_decisions,
  suppression_latches) have no UPDATE or DELETE statement anywhere in
  the code base. entity_mentions.mention_id has no foreign key; the
  pipeline checks memberships against mentions before every run.
  mentions.embedding holds little-endian float32 values
  (embedding_codec.hpp).
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS mentions (mention_id TEXT PRIMARY KEY, source_reference TEXT NOT NULL, source_system TEXT NOT NULL, raw_name TEXT NOT NULL,"
      " name_prefix TEXT, name_given TEXT, name_middle TEXT, name_family TEXT, name_suffix TEXT, name_nickname TEXT,"
      " parse_type INTEGER NOT NULL, parse_confidence REAL NOT NULL, parse_failed INTEGER NOT NULL, placeholder INTEGER NOT NULL,"
      " blocking_key TEXT NOT NULL, blocking_key_version TEXT NOT NULL, embedding BLOB, embedding_model TEXT NOT NULL, ingested_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS protection_flags (mention_id TEXT NOT NULL REFERENCES mentions(mention_id), reason TEXT NOT NULL, flagged_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS entities (entity_id TEXT PRIMARY KEY, canonical_name TEXT NOT NULL, canonical_mention_id TEXT NOT NULL, entity_type INTEGER NOT NULL,"
      " is_verified INTEGER NOT NULL, suppress_from_public INTEGER NOT NULL, confidence REAL NOT NULL, suppression_reasons TEXT NOT NULL,"
      " run_id TEXT NOT NULL, resolved_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS entity_mentions (entity_id TEXT NOT NULL REFERENCES entities(entity_id), mention_id TEXT NOT NULL UNIQUE, composite_score REAL NOT NULL,"
      " PRIMARY KEY (entity_id, mention_id));",
      "CREATE TABLE IF NOT EXISTS merge_decisions (seq INTEGER PRIMARY KEY AUTOINCREMENT, run_id TEXT NOT NULL, mention_id_a TEXT NOT NULL, mention_id_b TEXT NOT NULL,"
      " decision INTEGER NOT NULL, origin INTEGER NOT NULL, composite_score REAL NOT NULL, phonetic_match INTEGER NOT NULL, edit_similarity REAL NOT NULL,"
      " embedding_similarity REAL, type_agreement INTEGER NOT NULL, low_confidence INTEGER NOT NULL, parse_failed INTEGER NOT NULL, capped INTEGER NOT NULL,"
      " reason TEXT NOT NULL, decided_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS merge_decisions_run ON merge_decisions(run_id);",
      "CREATE TABLE IF NOT EXISTS review_items (mention_id_a TEXT NOT NULL, mention_id_b TEXT NOT NULL, run_id TEXT NOT NULL, composite_score REAL NOT NULL,"
      " origin INTEGER NOT NULL, PRIMARY KEY (mention_id_a, mention_id_b));",
      "CREATE TABLE IF NOT EXISTS review_overrides (mention_id_a TEXT NOT NULL, mention_id_b TEXT NOT NULL, verdict INTEGER NOT NULL, reviewer TEXT NOT NULL,"
      " note TEXT NOT NULL, decided_at_ms INTEGER NOT NULL, PRIMARY KEY (mention_id_a, mention_id_b));",
      "CREATE TABLE IF NOT EXISTS suppression_latches (mention_id TEXT PRIMARY KEY, reason TEXT NOT NULL, run_id TEXT NOT NULL, latched_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS runs (run_id TEXT PRIMARY KEY, started_at_ms INTEGER NOT NULL, finished_at_ms INTEGER NOT NULL, status INTEGER NOT NULL,"
      " config_fingerprint TEXT NOT NULL, report_json TEXT NOT NULL);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS mentions (mention_id TEXT PRIMARY KEY, source_reference TEXT NOT NULL, source_system TEXT NOT NULL, raw_name TEXT NOT NULL,"
      " name_prefix TEXT, name_given TEXT, name_middle TEXT, name_family TEXT, name_suffix TEXT, name_nickname TEXT,"
      " parse_type SMALLINT NOT NULL, parse_confidence DOUBLE PRECISION NOT NULL, parse_failed BOOLEAN NOT NULL, placeholder BOOLEAN NOT NULL,"
      " blocking_key TEXT NOT NULL, blocking_key_version TEXT NOT NULL, embedding BYTEA, embedding_model TEXT NOT NULL, ingested_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS protection_flags (mention_id TEXT NOT NULL REFERENCES mentions(mention_id), reason TEXT NOT NULL, flagged_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS entities (entity_id TEXT PRIMARY KEY, canonical_name TEXT NOT NULL, canonical_mention_id TEXT NOT NULL, entity_type SMALLINT NOT NULL,"
      " is_verified BOOLEAN NOT NULL, suppress_from_public BOOLEAN NOT NULL, confidence DOUBLE PRECISION NOT NULL, suppression_reasons TEXT NOT NULL,"
      " run_id TEXT NOT NULL, resolved_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS entity_mentions (entity_id TEXT NOT NULL REFERENCES entities(entity_id), mention_id TEXT NOT NULL UNIQUE,"
      " composite_score DOUBLE PRECISION NOT NULL, PRIMARY KEY (entity_id, mention_id));",
      "CREATE TABLE IF NOT EXISTS merge_decisions (seq BIGSERIAL PRIMARY KEY, run_id TEXT NOT NULL, mention_id_a TEXT NOT NULL, mention_id_b TEXT NOT NULL,"
      " decision SMALLINT NOT NULL, origin SMALLINT NOT NULL, composite_score DOUBLE PRECISION NOT NULL, phonetic_match BOOLEAN NOT NULL,"
      " edit_similarity DOUBLE PRECISION NOT NULL, embedding_similarity DOUBLE PRECISION, type_agreement SMALLINT NOT NULL, low_confidence BOOLEAN NOT NULL,"
      " parse_failed BOOLEAN NOT NULL, capped BOOLEAN NOT NULL, reason TEXT NOT NULL, decided_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS merge_decisions_run ON merge_decisions(run_id);",
      "CREATE TABLE IF NOT EXISTS review_items (mention_id_a TEXT NOT NULL, mention_id_b TEXT NOT NULL, run_id TEXT NOT NULL, composite_score DOUBLE PRECISION NOT NULL,"
      " origin SMALLINT NOT NULL, PRIMARY KEY (mention_id_a, mention_id_b));",
      "CREATE TABLE IF NOT EXISTS review_overrides (mention_id_a TEXT NOT NULL, mention_id_b TEXT NOT NULL, verdict SMALLINT NOT NULL, reviewer TEXT NOT NULL,"
      " note TEXT NOT NULL, decided_at_ms BIGINT NOT NULL, PRIMARY KEY (mention_id_a, mention_id_b));",
      "CREATE TABLE IF NOT EXISTS suppression_latches (mention_id TEXT PRIMARY KEY, reason TEXT NOT NULL, run_id TEXT NOT NULL, latched_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS runs (run_id TEXT PRIMARY KEY, started_at_ms BIGINT NOT NULL, finished_at_ms BIGINT NOT NULL, status SMALLINT NOT NULL,"
      " config_fingerprint TEXT NOT NULL, report_json TEXT NOT NULL);"};
  return kSchema;
}

} // namespace resolver::db::sql

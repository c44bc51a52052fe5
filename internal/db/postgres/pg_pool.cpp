#include "pg_pool.hpp"

#include <utility>

namespace resolver::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto* conn = new pqxx::connection(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn);
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_mention",
               "INSERT INTO mentions(mention_id,source_reference,source_system,raw_name,name_prefix,name_given,name_middle,name_family,"
               "name_suffix,name_nickname,parse_type,parse_confidence,parse_failed,placeholder,blocking_key,blocking_key_version,"
               "embedding,embedding_model,ingested_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19)");

  conn.prepare("insert_entity",
               "INSERT INTO entities(entity_id,canonical_name,canonical_mention_id,entity_type,is_verified,suppress_from_public,"
               "confidence,suppression_reasons,run_id,resolved_at_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)");

  conn.prepare("insert_entity_mention", "INSERT INTO entity_mentions(entity_id,mention_id,composite_score) VALUES($1,$2,$3)");

  conn.prepare("append_merge_decision",
               "INSERT INTO merge_decisions(run_id,mention_id_a,mention_id_b,decision,origin,composite_score,phonetic_match,"
               "edit_similarity,embedding_similarity,type_agreement,low_confidence,parse_failed,capped,reason,decided_at_ms)"
               " VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15)");

  conn.prepare("latch_suppression",
               "INSERT INTO suppression_latches(mention_id,reason,run_id,latched_at_ms) VALUES($1,$2,$3,$4)"
               " ON CONFLICT(mention_id) DO NOTHING");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  // a dropped connection frees its slot instead of going back to idle
  std::unique_ptr<pqxx::connection> owned(conn);
  const bool                        reusable = owned->is_open();
  {
    std::lock_guard lock(mutex_);
    if (reusable) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace resolver::db::postgres

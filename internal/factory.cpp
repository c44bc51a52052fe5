#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/parser/rule_name_parser.hpp"
#if RESOLVER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RESOLVER_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace resolver::factory {

namespace {

#if RESOLVER_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT mention_id,raw_name,blocking_key FROM mentions LIMIT 1;");
  sqlite_db->Exec("SELECT entity_id,canonical_name FROM entities LIMIT 1;");
  sqlite_db->Exec("SELECT seq,run_id FROM merge_decisions LIMIT 1;");
}
#endif

#if RESOLVER_DB_POSTGRES
constexpr std::size_t kDefaultPgConnections = 4;

void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT mention_id,raw_name,blocking_key FROM mentions LIMIT 1;");
  tx.exec("SELECT entity_id,canonical_name FROM entities LIMIT 1;");
  tx.exec("SELECT seq,run_id FROM merge_decisions LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const resolver::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RESOLVER_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    RESOLVER_LOG_INFO("opened sqlite store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RESOLVER_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? kDefaultPgConnections : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    RESOLVER_LOG_INFO("opened postgres store", {observability::IntField("max_connections", static_cast<std::int64_t>(max_connections))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RESOLVER_LOG_WARN("no database configured, using the in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const resolver::runtime::config::RuntimeConfig& config) {
  Application app;

  app.settings   = config::BuildResolutionSettings(config);
  app.repository = BuildRepository(config);
  app.parser     = std::make_unique<parser::RuleNameParser>();
  app.workers    = std::make_unique<runtime::WorkerPool>(app.settings.worker_threads);

  return app;
}

} // namespace resolver::factory

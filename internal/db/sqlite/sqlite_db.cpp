#include "sqlite_db.hpp"

#include <stdexcept>

namespace resolver::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open store " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets `report` and `export` read while a run holds the write lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  } else {
    Exec("PRAGMA synchronous=FULL;");
  }

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  // repository distinguishes PRIMARYKEY/UNIQUE from other constraint failures
  ThrowIf(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace resolver::db::sqlite

#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace resolver::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per store file. SQLITE_OPEN_FULLMUTEX makes the handle
  safe to share, but the pipeline only writes from the run thread.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool wal_mode);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema, BEGIN/COMMIT)
  void Exec(const std::string& sql);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace resolver::db::sqlite

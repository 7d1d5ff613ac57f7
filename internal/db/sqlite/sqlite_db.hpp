#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/result.hpp"

namespace timekeeper::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per store. Transactions on it are serialized in-process by
  Mutex(); other processes are kept out by sqlite's own file locks.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& Mutex() {
    return mutex_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema, transaction control).
  // Throws DbError.
  void Exec(const std::string& sql);

  // Map a sqlite return code onto a portable Result.
  Result Translate(int rc) const;

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

} // namespace timekeeper::db::sqlite

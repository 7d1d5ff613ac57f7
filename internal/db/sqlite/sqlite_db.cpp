#include "sqlite_db.hpp"

namespace timekeeper::db::sqlite {

namespace {

ErrorCode CodeFor(int rc) {
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_PERM:
    case SQLITE_READONLY:
    case SQLITE_FULL:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw DbError(CodeFor(rc), "open " + path_ + ": " + msg);
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

Result SqliteDB::Translate(int rc) const {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  return Result::Err(CodeFor(rc), db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw DbError(CodeFor(rc), msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  int rc = sqlite3_busy_timeout(db_, 5000);
  if (rc != SQLITE_OK) {
    throw DbError(Translate(rc));
  }

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace timekeeper::db::sqlite

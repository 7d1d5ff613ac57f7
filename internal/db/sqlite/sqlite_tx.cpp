#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace timekeeper::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, bool writable)
    : db_(std::move(db)), guard_(db_->Mutex()) {
  db_->Exec(writable ? "BEGIN IMMEDIATE;" : "BEGIN;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      TIMEKEEPER_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()),
                                                      observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  guard_.unlock();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
  guard_.unlock();
}

} // namespace timekeeper::db::sqlite

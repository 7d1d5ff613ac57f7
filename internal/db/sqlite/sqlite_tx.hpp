#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace timekeeper::db::sqlite {

/*
  SQLite transaction wrapper.

  Read:  BEGIN (deferred), shared lock taken by the first SELECT
  Write: BEGIN IMMEDIATE, write lock taken up front
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, bool writable);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }
  SqliteDB& DB() const { return *db_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> guard_;
  bool committed_ = false;
};

}

#pragma once

namespace timekeeper::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - A read transaction holds a shared lock over the whole store; a write
    transaction holds an exclusive one. Both last until Commit()/Rollback()
    or destruction, so callers keep them scoped to a single operation.
  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN (read) / BEGIN IMMEDIATE (write)
  File:   flock LOCK_SH / LOCK_EX, write-to-temp + rename on commit
  Memory: std::shared_mutex, snapshot copy for writes
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}

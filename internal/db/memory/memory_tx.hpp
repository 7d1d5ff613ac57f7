#pragma once

#include <mutex>
#include <shared_mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace timekeeper::db::memory {

/*
  Read transaction  = shared lock, reads the committed state in place
  Write transaction = exclusive lock + snapshot copy, swapped in on Commit()
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool writable);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                   repo_;
  bool                                writable_;
  std::shared_lock<std::shared_mutex> read_lock_;
  std::unique_lock<std::shared_mutex> write_lock_;
  MemoryRepository::State             working_;
  bool                                committed_ = false;
};

} // namespace timekeeper::db::memory

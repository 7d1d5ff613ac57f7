#include "memory_tx.hpp"

namespace timekeeper::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool writable) : repo_(repo), writable_(writable) {
  if (writable_) {
    write_lock_ = std::unique_lock<std::shared_mutex>(repo_.mutex_);
    working_    = repo_.committed_; // snapshot copy
  } else {
    read_lock_ = std::shared_lock<std::shared_mutex>(repo_.mutex_);
  }
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!writable_) {
    throw DbError(ErrorCode::Unsupported, "write attempted in a read-only memory transaction");
  }
  return working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  return writable_ ? working_ : repo_.committed_;
}

void MemoryTransaction::Commit() {
  if (writable_ && write_lock_.owns_lock()) {
    repo_.committed_ = std::move(working_);
    write_lock_.unlock();
  }
  if (read_lock_.owns_lock()) {
    read_lock_.unlock();
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  if (write_lock_.owns_lock()) write_lock_.unlock();
  if (read_lock_.owns_lock()) read_lock_.unlock();
  committed_ = true;
}

} // namespace timekeeper::db::memory

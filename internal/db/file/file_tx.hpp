#pragma once

#include <filesystem>

#include "internal/db/api/transaction.hpp"
#include "timekeeper/store/v1/store.pb.h"

namespace timekeeper::db::file {

/*
  Holds the flock for its whole lifetime and works on a parsed copy of the
  document. Only write transactions may Commit() changes back to disk.
*/
class FileTransaction final : public db::Transaction {
 public:
  enum class Mode { kRead, kWrite, kCreate };

  FileTransaction(const std::filesystem::path& path, const std::filesystem::path& lock_path, Mode mode);
  ~FileTransaction();

  FileTransaction(const FileTransaction&)            = delete;
  FileTransaction& operator=(const FileTransaction&) = delete;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  timekeeper::store::v1::StoreDocument&       Mutable();
  const timekeeper::store::v1::StoreDocument& View() const {
    return document_;
  }

 private:
  void Lock(bool exclusive);
  void Unlock();
  void Load();
  void Persist();

  std::filesystem::path                path_;
  std::filesystem::path                lock_path_;
  Mode                                 mode_;
  int                                  lock_fd_ = -1;
  timekeeper::store::v1::StoreDocument document_;
  bool                                 committed_ = false;
};

} // namespace timekeeper::db::file

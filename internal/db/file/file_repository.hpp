#pragma once

#include <filesystem>

#include "internal/db/api/repository.hpp"

namespace timekeeper::db::file {

class FileTransaction;

/*
  Single-file JSON store.

  The whole store is one document {"matches": {...}, "users": {...}}.
  Concurrent processes coordinate through flock() on a companion
  "<path>.lock" file: shared for reads, exclusive for writes. Commits write
  "<path>.tmp", fsync it and rename it over the store, so readers never see a
  half-written document and a failed commit leaves the old one in place.
*/
class FileRepository final : public db::Repository {
public:
  // Creates parent directories and an empty document when none exists.
  explicit FileRepository(std::filesystem::path path);

  std::unique_ptr<Transaction> BeginRead() override;
  std::unique_ptr<Transaction> Begin() override;

  Result UpsertMatch(Transaction&, const model::MatchRecord&) override;
  std::optional<model::MatchRecord> GetMatch(Transaction&, const std::string&) override;
  std::vector<model::MatchRecord> ListMatches(Transaction&) override;

  Result UpsertFollowList(Transaction&, const model::FollowListRecord&) override;
  std::optional<model::FollowListRecord> GetFollowList(Transaction&, const std::string&) override;

private:
  friend class FileTransaction;

  std::filesystem::path path_;
  std::filesystem::path lock_path_;
};

}

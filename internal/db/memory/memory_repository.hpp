#pragma once

#include <map>
#include <shared_mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace timekeeper::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> BeginRead() override;
  std::unique_ptr<Transaction> Begin() override;

  Result UpsertMatch(Transaction&, const model::MatchRecord&) override;
  std::optional<model::MatchRecord> GetMatch(Transaction&, const std::string&) override;
  std::vector<model::MatchRecord> ListMatches(Transaction&) override;

  Result UpsertFollowList(Transaction&, const model::FollowListRecord&) override;
  std::optional<model::FollowListRecord> GetFollowList(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::MatchRecord> matches;
    std::map<std::string, model::FollowListRecord> users;
  };

  std::shared_mutex mutex_;
  State committed_;
};

}

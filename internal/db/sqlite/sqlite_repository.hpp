#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace timekeeper::db::sqlite {

/*
  Tables:
    matches       one row per match, timer_state flattened into columns
    users         one row per user that has a follow list
    user_follows  (user_id, position) -> match_id
*/
class SqliteRepository final : public db::Repository {
public:
  // Creates the schema when the database is new.
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> BeginRead() override;
  std::unique_ptr<Transaction> Begin() override;

  Result UpsertMatch(Transaction&, const model::MatchRecord&) override;
  std::optional<model::MatchRecord> GetMatch(Transaction&, const std::string&) override;
  std::vector<model::MatchRecord> ListMatches(Transaction&) override;

  Result UpsertFollowList(Transaction&, const model::FollowListRecord&) override;
  std::optional<model::FollowListRecord> GetFollowList(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  void BootstrapSchema();
};

}

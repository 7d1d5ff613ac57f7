#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/follow_list_record.hpp"
#include "internal/db/model/match_record.hpp"

namespace timekeeper::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a transaction opened with Begin()
  - Reads may use BeginRead() (shared) or Begin() (exclusive)
  - Reads inside a transaction see its writes
  - Upserts fully overwrite the previous value for the key

  Reads report backend failures by throwing DbError; writes return Result.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Matches
  // ---------------------------------------------------------------------

  virtual Result UpsertMatch(Transaction&, const model::MatchRecord&) = 0;

  virtual std::optional<model::MatchRecord> GetMatch(Transaction&, const std::string& match_id) = 0;

  virtual std::vector<model::MatchRecord> ListMatches(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Follow lists
  // ---------------------------------------------------------------------

  virtual Result UpsertFollowList(Transaction&, const model::FollowListRecord&) = 0;

  virtual std::optional<model::FollowListRecord> GetFollowList(Transaction&, const std::string& user_id) = 0;
};

} // namespace timekeeper::db

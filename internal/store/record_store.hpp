#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/match.hpp"

namespace timekeeper::db {
class Repository;
}

namespace timekeeper::store {

/*
  Durable match and follow-list storage on top of a db::Repository.

  Every load runs in its own shared transaction and every save in its own
  exclusive one, so concurrent saves serialize and a load never sees half of
  a save. Backend failures surface as util::StoreUnavailable, unreadable
  persisted content as util::StoreCorrupted.
*/
class RecordStore {
 public:
  explicit RecordStore(std::shared_ptr<db::Repository> repository);

  // Upsert, fully overwriting any previous record with the same id.
  void SaveMatch(const model::Match& match);

  std::optional<model::Match> LoadMatch(const std::string& match_id);

  std::vector<model::Match> ListAllMatches();

  void SaveFollowList(const model::FollowList& list);

  std::optional<model::FollowList> LoadFollowList(const std::string& user_id);

  // Read-modify-write of one user's follow list inside a single exclusive
  // transaction. The mutation starts from an empty list for an unknown user.
  model::FollowList UpdateFollowList(const std::string& user_id, const std::function<void(model::FollowList&)>& mutation);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace timekeeper::store

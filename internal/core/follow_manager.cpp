#include "follow_manager.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/store/record_store.hpp"

namespace timekeeper::core {

using observability::StringField;

FollowManager::FollowManager(std::shared_ptr<store::RecordStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("follow manager requires a record store");
  }
}

bool FollowManager::Follow(const std::string& user_id, const std::string& match_id) {
  bool added = false;
  store_->UpdateFollowList(user_id, [&](model::FollowList& list) {
    auto& ids = list.match_list;
    if (std::find(ids.begin(), ids.end(), match_id) == ids.end()) {
      ids.push_back(match_id);
      added = true;
    }
  });

  if (added) {
    TIMEKEEPER_LOG_INFO("match followed", {StringField("user_id", user_id), StringField("match_id", match_id)});
  }
  return added;
}

void FollowManager::Unfollow(const std::string& user_id, const std::string& match_id) {
  store_->UpdateFollowList(user_id, [&](model::FollowList& list) {
    auto& ids = list.match_list;
    ids.erase(std::remove(ids.begin(), ids.end(), match_id), ids.end());
  });
}

std::vector<std::string> FollowManager::FollowedMatches(const std::string& user_id) {
  auto list = store_->LoadFollowList(user_id);
  if (!list) {
    return {};
  }
  return list->match_list;
}

} // namespace timekeeper::core

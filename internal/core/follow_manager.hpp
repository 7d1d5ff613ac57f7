#pragma once

#include <memory>
#include <string>
#include <vector>

namespace timekeeper::store {
class RecordStore;
}

namespace timekeeper::core {

// Per-user list of followed match ids. Membership is explicit: creating a
// match does not make its admin a follower.
class FollowManager {
 public:
  explicit FollowManager(std::shared_ptr<store::RecordStore> store);

  // Returns false when the match was already followed.
  bool Follow(const std::string& user_id, const std::string& match_id);

  void Unfollow(const std::string& user_id, const std::string& match_id);

  // Insertion order; empty for an unknown user.
  std::vector<std::string> FollowedMatches(const std::string& user_id);

 private:
  std::shared_ptr<store::RecordStore> store_;
};

} // namespace timekeeper::core

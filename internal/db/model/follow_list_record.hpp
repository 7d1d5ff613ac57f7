#pragma once

#include <string>
#include <vector>

namespace timekeeper::db::model {

struct FollowListRecord {
  std::string              user_id;
  std::vector<std::string> match_list;  // ordered
};

}

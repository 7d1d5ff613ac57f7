#pragma once

#include <memory>

namespace timekeeper::core {
class MatchManager;
class FollowManager;
}

namespace timekeeper::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<timekeeper::core::MatchManager>  matches;
  std::shared_ptr<timekeeper::core::FollowManager> follows;
};

}

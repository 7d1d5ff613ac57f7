#include "access_control.hpp"

namespace timekeeper::access {

bool IsAdmin(std::string_view user_id, const model::Match& match) {
  return !user_id.empty() && user_id == match.admin_id;
}

bool CanControlTimer(std::string_view user_id, const model::Match& match) {
  return IsAdmin(user_id, match);
}

bool CanViewMatch(std::string_view, const model::Match&) {
  return true;
}

} // namespace timekeeper::access

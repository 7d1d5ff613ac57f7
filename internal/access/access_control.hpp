#pragma once

#include <string_view>

#include "internal/model/match.hpp"

namespace timekeeper::access {

/*
  Stateless permission checks. Identity is a bearer string compared exactly
  (case sensitive, no normalization). An empty caller id is never the admin,
  even for a record whose admin_id is itself empty.
*/

bool IsAdmin(std::string_view user_id, const model::Match& match);

// Only the admin moves the clock.
bool CanControlTimer(std::string_view user_id, const model::Match& match);

// Anyone holding the match id may watch it.
bool CanViewMatch(std::string_view user_id, const model::Match& match);

} // namespace timekeeper::access

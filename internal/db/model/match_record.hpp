#pragma once

#include <cstdint>
#include <string>

namespace timekeeper::db::model {

/*
  Persistent match row.

  Timestamps are kept as ISO-8601 text exactly as stored; parsing them is the
  record store's job so a malformed value surfaces as store corruption.
*/

struct MatchRecord {
  std::string match_id;
  std::string description;
  std::string admin_id;

  // timer_state
  std::int32_t seconds_remaining = 0;
  bool         is_running        = false;
  std::string  last_update;
  std::int32_t total_paused_time = 0;

  std::string created_at;
  bool        is_active = true;
};

}

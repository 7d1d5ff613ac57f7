#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace timekeeper::model {

// Regulation time of one match (90 minutes).
inline constexpr std::int32_t kMatchDurationSeconds = 5400;

struct TimerState {
  std::int32_t    seconds_remaining = kMatchDurationSeconds;
  bool            is_running        = false;
  util::TimePoint last_update{};
  // Reserved; cleared on reset.
  std::int32_t total_paused_time = 0;

  bool operator==(const TimerState&) const = default;
};

struct Match {
  std::string     match_id;
  std::string     description;
  std::string     admin_id;
  TimerState      timer_state;
  util::TimePoint created_at{};
  bool            is_active = true;

  bool operator==(const Match&) const = default;
};

// Match ids a user chose to track, in insertion order, without duplicates.
struct FollowList {
  std::string              user_id;
  std::vector<std::string> match_list;

  bool operator==(const FollowList&) const = default;
};

} // namespace timekeeper::model

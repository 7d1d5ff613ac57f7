#include "timer_engine.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <sstream>

#include "internal/util/errors.hpp"

namespace timekeeper::timer {

using model::kMatchDurationSeconds;
using model::TimerOperation;
using model::TimerState;

namespace {

std::int64_t WholeSecondsBetween(util::TimePoint from, util::TimePoint to) {
  if (to <= from) {
    return 0;
  }
  // duration_cast truncates toward zero
  return std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
}

std::int32_t ParseField(std::string_view field, std::string_view text) {
  std::int32_t value = 0;
  const auto* first = field.data();
  const auto* last  = field.data() + field.size();
  auto [ptr, ec]    = std::from_chars(first, last, value);
  if (field.size() != 2 || ec != std::errc{} || ptr != last || value < 0) {
    throw util::ValidationFailure("malformed clock '" + std::string(text) + "', expected HH:MM:SS");
  }
  return value;
}

} // namespace

TimerState Initialize(util::TimePoint now) {
  TimerState state;
  state.seconds_remaining = kMatchDurationSeconds;
  state.is_running        = false;
  state.last_update       = now;
  state.total_paused_time = 0;
  return state;
}

TimerState Pause(TimerState state, util::TimePoint now) {
  state.is_running  = false;
  state.last_update = std::max(state.last_update, now);
  return state;
}

TimerState Resume(TimerState state, util::TimePoint now) {
  state.is_running  = true;
  state.last_update = std::max(state.last_update, now);
  return state;
}

TimerState Reset(TimerState state, util::TimePoint now) {
  state.seconds_remaining = kMatchDurationSeconds;
  state.is_running        = false;
  state.last_update       = std::max(state.last_update, now);
  state.total_paused_time = 0;
  return state;
}

TimerState Reconcile(TimerState state, util::TimePoint now) {
  if (!state.is_running) {
    return state;
  }

  const auto elapsed = WholeSecondsBetween(state.last_update, now);
  const auto left    = std::max<std::int64_t>(0, static_cast<std::int64_t>(state.seconds_remaining) - elapsed);

  state.seconds_remaining = static_cast<std::int32_t>(left);
  state.last_update       = std::max(state.last_update, now);
  if (state.seconds_remaining == 0) {
    state.is_running = false;
  }
  return state;
}

TimerState Tick(TimerState state, util::TimePoint now) {
  if (!state.is_running || state.seconds_remaining <= 0) {
    return state;
  }

  state.seconds_remaining -= 1;
  state.last_update = std::max(state.last_update, now);
  if (state.seconds_remaining == 0) {
    state.is_running = false;
  }
  return state;
}

model::TimerPhase PhaseOf(const TimerState& state) {
  return model::PhaseOf(state.is_running, state.seconds_remaining);
}

std::int32_t ElapsedMatchSeconds(const TimerState& state) {
  return kMatchDurationSeconds - state.seconds_remaining;
}

std::string FormatClock(std::int32_t seconds) {
  if (seconds < 0) {
    throw util::ValidationFailure("cannot format negative clock value " + std::to_string(seconds));
  }

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(2) << seconds / 3600 << ':' << std::setw(2) << (seconds % 3600) / 60 << ':' << std::setw(2)
      << seconds % 60;
  return oss.str();
}

std::int32_t ParseClock(std::string_view text) {
  if (text.size() != 8 || text[2] != ':' || text[5] != ':') {
    throw util::ValidationFailure("malformed clock '" + std::string(text) + "', expected HH:MM:SS");
  }

  const auto hours   = ParseField(text.substr(0, 2), text);
  const auto minutes = ParseField(text.substr(3, 2), text);
  const auto seconds = ParseField(text.substr(6, 2), text);
  if (minutes > 59 || seconds > 59) {
    throw util::ValidationFailure("clock '" + std::string(text) + "' has minutes or seconds above 59");
  }
  return hours * 3600 + minutes * 60 + seconds;
}

TimerOperation ParseTimerOperation(std::string_view name) {
  if (name == "pause") return TimerOperation::kPause;
  if (name == "resume") return TimerOperation::kResume;
  if (name == "reset") return TimerOperation::kReset;
  if (name == "stop") return TimerOperation::kStop;
  throw util::UnknownOperation("unknown timer operation: '" + std::string(name) + "'");
}

std::string_view ToString(TimerOperation op) {
  switch (op) {
    case TimerOperation::kPause:
      return "pause";
    case TimerOperation::kResume:
      return "resume";
    case TimerOperation::kReset:
      return "reset";
    case TimerOperation::kStop:
      return "stop";
  }
  return "unknown";
}

} // namespace timekeeper::timer

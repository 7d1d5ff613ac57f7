#pragma once

#include <cstdint>

namespace timekeeper::model {

enum class TimerPhase : std::uint8_t {
  kIdle = 0,
  kRunning = 1,
  kExpired = 2,
};

enum class TimerOperation : std::uint8_t {
  kPause = 0,
  kResume = 1,
  kReset = 2,
  kStop = 3,
};

constexpr TimerPhase PhaseOf(bool is_running, std::int32_t seconds_remaining) {
  if (seconds_remaining <= 0 && !is_running) {
    return TimerPhase::kExpired;
  }
  return is_running ? TimerPhase::kRunning : TimerPhase::kIdle;
}

// Stop ends the match itself; the other operations only move the clock.
constexpr bool EndsMatch(TimerOperation op) {
  return op == TimerOperation::kStop;
}

} // namespace timekeeper::model

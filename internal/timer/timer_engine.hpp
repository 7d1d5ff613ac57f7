#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/match.hpp"
#include "internal/model/timer_phase.hpp"
#include "internal/util/time.hpp"

namespace timekeeper::timer {

/*
  Countdown state machine for a single match.

  Nothing ticks in the background. A running timer only stores the instant of
  its last observation; Reconcile() catches the countdown up to `now` and must
  run on every read before seconds_remaining is trusted.

  All functions are pure: they take a state by value and return the new one.
*/

model::TimerState Initialize(util::TimePoint now);

// Idempotent when already paused.
model::TimerState Pause(model::TimerState state, util::TimePoint now);

// Allowed on an expired timer; the next Reconcile() expires it again.
model::TimerState Resume(model::TimerState state, util::TimePoint now);

model::TimerState Reset(model::TimerState state, util::TimePoint now);

// Subtracts the whole seconds elapsed since last_update from a running timer,
// stopping it at zero. No-op for a paused timer. A `now` earlier than
// last_update counts as zero elapsed and never moves last_update backwards.
model::TimerState Reconcile(model::TimerState state, util::TimePoint now);

// Fixed-step alternative to Reconcile(): exactly one second per call.
model::TimerState Tick(model::TimerState state, util::TimePoint now);

model::TimerPhase PhaseOf(const model::TimerState& state);

// Match time used so far.
std::int32_t ElapsedMatchSeconds(const model::TimerState& state);

// "HH:MM:SS", zero padded.
std::string FormatClock(std::int32_t seconds);

// Inverse of FormatClock(); throws util::ValidationFailure.
std::int32_t ParseClock(std::string_view text);

// "pause", "resume", "reset" or "stop"; throws util::UnknownOperation.
model::TimerOperation ParseTimerOperation(std::string_view name);
std::string_view      ToString(model::TimerOperation op);

} // namespace timekeeper::timer

#include "internal/timer/timer_engine.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <regex>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using timekeeper::model::kMatchDurationSeconds;
using timekeeper::model::TimerOperation;
using timekeeper::model::TimerPhase;
using timekeeper::util::TimePoint;

namespace timer = timekeeper::timer;

const TimePoint kT0 = TimePoint{} + std::chrono::hours(24 * 365 * 50);

void TestInitializeIsIdleAtFullDuration() {
  auto state = timer::Initialize(kT0);
  assert(state.seconds_remaining == kMatchDurationSeconds);
  assert(!state.is_running);
  assert(state.total_paused_time == 0);
  assert(state.last_update == kT0);
  assert(timer::PhaseOf(state) == TimerPhase::kIdle);
  assert(timer::ElapsedMatchSeconds(state) == 0);
}

void TestReconcileOnlyCountsWholeSeconds() {
  auto state = timer::Resume(timer::Initialize(kT0), kT0);

  auto after = timer::Reconcile(state, kT0 + 1900ms);
  assert(after.seconds_remaining == kMatchDurationSeconds - 1);
  assert(after.is_running);
  assert(after.last_update == kT0 + 1900ms);
  assert(timer::ElapsedMatchSeconds(after) == 1);
}

void TestReconcileIgnoresPausedTimer() {
  auto state  = timer::Pause(timer::Resume(timer::Initialize(kT0), kT0), kT0 + 10s);
  auto frozen = timer::Reconcile(state, kT0 + 3600s);
  assert(frozen == state);
}

void TestReconcileNeverMovesBackwards() {
  auto state = timer::Resume(timer::Initialize(kT0), kT0 + 5s);

  auto skewed = timer::Reconcile(state, kT0);
  assert(skewed.seconds_remaining == kMatchDurationSeconds);
  assert(skewed.last_update == kT0 + 5s);
  assert(skewed.is_running);
}

void TestCountdownReachesZeroAndStops() {
  auto state = timer::Resume(timer::Initialize(kT0), kT0);

  std::int32_t previous = state.seconds_remaining;
  TimePoint    now      = kT0;
  for (int i = 0; i < 60; ++i) {
    now += 97s;
    state = timer::Reconcile(state, now);
    assert(state.seconds_remaining <= previous);
    previous = state.seconds_remaining;
  }

  assert(state.seconds_remaining == 0);
  assert(!state.is_running);
  assert(timer::PhaseOf(state) == TimerPhase::kExpired);

  auto later = timer::Reconcile(state, now + 1000s);
  assert(later.seconds_remaining == 0);
}

void TestResumeOnExpiredTimerExpiresAgain() {
  auto state = timer::Reconcile(timer::Resume(timer::Initialize(kT0), kT0), kT0 + 6000s);
  assert(timer::PhaseOf(state) == TimerPhase::kExpired);

  state = timer::Resume(state, kT0 + 6001s);
  assert(state.is_running);
  assert(state.seconds_remaining == 0);

  state = timer::Reconcile(state, kT0 + 6001s);
  assert(!state.is_running);
  assert(timer::PhaseOf(state) == TimerPhase::kExpired);
}

void TestPauseIsIdempotent() {
  auto once  = timer::Pause(timer::Initialize(kT0), kT0 + 1s);
  auto twice = timer::Pause(once, kT0 + 1s);
  assert(once == twice);
  assert(!twice.is_running);
}

void TestResetRestoresFullDuration() {
  auto state              = timer::Resume(timer::Initialize(kT0), kT0);
  state                   = timer::Reconcile(state, kT0 + 125s);
  state.total_paused_time = 12;

  state = timer::Reset(state, kT0 + 126s);
  assert(state.seconds_remaining == kMatchDurationSeconds);
  assert(!state.is_running);
  assert(state.total_paused_time == 0);
  assert(state.last_update == kT0 + 126s);
}

void TestTickDecrementsOneSecond() {
  auto idle = timer::Initialize(kT0);
  assert(timer::Tick(idle, kT0 + 1s) == idle);

  timekeeper::model::TimerState last_second;
  last_second.seconds_remaining = 1;
  last_second.is_running        = true;
  last_second.last_update       = kT0;

  auto ticked = timer::Tick(last_second, kT0 + 1s);
  assert(ticked.seconds_remaining == 0);
  assert(!ticked.is_running);
  assert(timer::Tick(ticked, kT0 + 2s) == ticked);
}

void TestClockFormatRoundTrip() {
  const std::regex pattern("^\\d{2}:\\d{2}:\\d{2}$");
  for (std::int32_t s = 0; s <= kMatchDurationSeconds; ++s) {
    const auto text = timer::FormatClock(s);
    assert(std::regex_match(text, pattern));
    assert(timer::ParseClock(text) == s);
    const int hours = std::stoi(text.substr(0, 2));
    assert(hours == 0 || hours == 1);
  }

  assert(timer::FormatClock(0) == "00:00:00");
  assert(timer::FormatClock(5400) == "01:30:00");
  assert(timer::FormatClock(3599) == "00:59:59");
}

void TestParseClockRejectsMalformedText() {
  for (const char* bad : {"", "1:30:00", "01:60:00", "01:00:60", "aa:bb:cc", "01-30-00", "-1:00:00", "01:30:000"}) {
    bool threw = false;
    try {
      (void)timer::ParseClock(bad);
    } catch (const timekeeper::util::ValidationFailure&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestTimerOperationNames() {
  assert(timer::ParseTimerOperation("pause") == TimerOperation::kPause);
  assert(timer::ParseTimerOperation("resume") == TimerOperation::kResume);
  assert(timer::ParseTimerOperation("reset") == TimerOperation::kReset);
  assert(timer::ParseTimerOperation("stop") == TimerOperation::kStop);
  assert(timer::ToString(TimerOperation::kResume) == "resume");

  bool threw = false;
  try {
    (void)timer::ParseTimerOperation("Pause");
  } catch (const timekeeper::util::UnknownOperation&) {
    threw = true;
  }
  assert(threw && "operation names are case sensitive");
}

} // namespace

int main() {
  TestInitializeIsIdleAtFullDuration();
  TestReconcileOnlyCountsWholeSeconds();
  TestReconcileIgnoresPausedTimer();
  TestReconcileNeverMovesBackwards();
  TestCountdownReachesZeroAndStops();
  TestResumeOnExpiredTimerExpiresAgain();
  TestPauseIsIdempotent();
  TestResetRestoresFullDuration();
  TestTickDecrementsOneSecond();
  TestClockFormatRoundTrip();
  TestParseClockRejectsMalformedText();
  TestTimerOperationNames();

  std::cout << "timekeeper_unit_timer_engine: pass\n";
  return 0;
}

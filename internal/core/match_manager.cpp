#include "match_manager.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/store/record_store.hpp"
#include "internal/timer/timer_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace timekeeper::core {

using observability::StringField;

MatchManager::MatchManager(std::shared_ptr<store::RecordStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
  if (!store_) {
    throw std::invalid_argument("match manager requires a record store");
  }
  if (!clock_) {
    clock_ = util::Now;
  }
}

model::Match MatchManager::CreateMatch(const std::string& description, const std::string& admin_id) {
  const auto now = Now();

  model::Match match;
  match.match_id    = util::ToString(util::GenerateUUID());
  match.description = description;
  match.admin_id    = admin_id;
  match.timer_state = timer::Initialize(now);
  match.created_at  = now;
  match.is_active   = true;

  store_->SaveMatch(match);

  TIMEKEEPER_LOG_INFO("match created", {StringField("match_id", match.match_id), StringField("admin_id", admin_id)});
  return match;
}

std::optional<model::Match> MatchManager::GetMatch(const std::string& match_id) {
  return store_->LoadMatch(match_id);
}

void MatchManager::UpdateMatch(const model::Match& match) {
  store_->SaveMatch(match);
}

void MatchManager::DeleteMatch(const std::string& match_id) {
  auto match = store_->LoadMatch(match_id);
  if (!match) {
    return;
  }

  match->is_active = false;
  store_->SaveMatch(*match);

  TIMEKEEPER_LOG_INFO("match deleted", {StringField("match_id", match_id)});
}

std::vector<model::Match> MatchManager::ListActiveMatches(const std::vector<std::string>& match_ids) {
  std::vector<model::Match> active;
  active.reserve(match_ids.size());

  for (const auto& id : match_ids) {
    auto match = store_->LoadMatch(id);
    if (match && match->is_active) {
      active.push_back(std::move(*match));
    }
  }
  return active;
}

model::Match MatchManager::Refresh(model::Match match) const {
  match.timer_state = timer::Reconcile(match.timer_state, Now());
  return match;
}

model::Match MatchManager::ApplyTimerOperation(model::Match match, model::TimerOperation op) const {
  if (!match.is_active) {
    throw util::InactiveMatchOperation("match " + match.match_id + " is no longer active; " +
                                       std::string(timer::ToString(op)) + " rejected");
  }

  const auto now = Now();
  switch (op) {
    case model::TimerOperation::kPause:
      match.timer_state = timer::Pause(match.timer_state, now);
      break;
    case model::TimerOperation::kResume:
      match.timer_state = timer::Resume(match.timer_state, now);
      break;
    case model::TimerOperation::kReset:
      match.timer_state = timer::Reset(match.timer_state, now);
      break;
    case model::TimerOperation::kStop:
      match.timer_state = timer::Pause(match.timer_state, now);
      break;
  }
  if (model::EndsMatch(op)) {
    match.is_active = false;
  }
  return match;
}

util::TimePoint MatchManager::Now() const {
  return clock_();
}

} // namespace timekeeper::core

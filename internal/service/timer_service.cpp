#include "timer_service.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>

#include "internal/access/access_control.hpp"
#include "internal/core/follow_manager.hpp"
#include "internal/core/match_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/timer/timer_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/validation.hpp"

namespace timekeeper::service {

using namespace timekeeper::v1;
using observability::ClockField;
using observability::StringField;

namespace {

template <typename Fn>
auto ObserveRequest(std::string_view route, const std::string& user_id, Fn&& fn) {
  try {
    return fn();
  } catch (const util::StoreUnavailable& ex) {
    TIMEKEEPER_LOG_ERROR("request failed",
                         {StringField("route", route), StringField("user_id", user_id), StringField("error", ex.what())});
    throw;
  } catch (const util::StoreCorrupted& ex) {
    TIMEKEEPER_LOG_ERROR("request failed",
                         {StringField("route", route), StringField("user_id", user_id), StringField("error", ex.what())});
    throw;
  } catch (const std::exception& ex) {
    TIMEKEEPER_LOG_WARN("request rejected",
                        {StringField("route", route), StringField("user_id", user_id), StringField("error", ex.what())});
    throw;
  }
}

// Ids are generated lowercase; accept either case from callers.
std::string CanonicalMatchId(const std::string& text) {
  if (!util::IsValidMatchId(text)) {
    throw util::ValidationFailure("invalid match id '" + text + "'");
  }
  std::string id = text;
  std::transform(id.begin(), id.end(), id.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return id;
}

TimerPhase ToProto(model::TimerPhase phase) {
  switch (phase) {
    case model::TimerPhase::kIdle:
      return TIMER_PHASE_IDLE;
    case model::TimerPhase::kRunning:
      return TIMER_PHASE_RUNNING;
    case model::TimerPhase::kExpired:
      return TIMER_PHASE_EXPIRED;
  }
  return TIMER_PHASE_UNSPECIFIED;
}

MatchView ToView(const model::Match& match, const std::string& user_id) {
  MatchView view;

  auto* m = view.mutable_match();
  m->set_match_id(match.match_id);
  m->set_description(match.description);
  m->set_admin_id(match.admin_id);
  m->set_is_active(match.is_active);
  *m->mutable_created_at() = util::ToProto(match.created_at);

  auto* timer = m->mutable_timer_state();
  timer->set_seconds_remaining(match.timer_state.seconds_remaining);
  timer->set_is_running(match.timer_state.is_running);
  timer->set_total_paused_time(match.timer_state.total_paused_time);
  *timer->mutable_last_update() = util::ToProto(match.timer_state.last_update);

  view.set_clock(timer::FormatClock(match.timer_state.seconds_remaining));
  view.set_phase(ToProto(timer::PhaseOf(match.timer_state)));
  view.set_is_admin(access::IsAdmin(user_id, match));
  view.set_can_control(access::CanControlTimer(user_id, match));
  return view;
}

} // namespace

TimerService::TimerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// Loads and reconciles a match, writing it back when the clock moved.
static model::Match LoadCurrent(core::MatchManager& matches, const std::string& match_id) {
  auto stored = matches.GetMatch(match_id);
  if (!stored) {
    throw util::NotFound("match " + match_id + " not found");
  }

  auto current = matches.Refresh(*stored);
  if (current != *stored) {
    matches.UpdateMatch(current);
  }
  return current;
}

CreateMatchResponse TimerService::CreateMatch(const CreateMatchRequest& req) {
  return ObserveRequest("TimerService.CreateMatch", req.user_id(), [&] {
    util::ValidateUserId(req.user_id());
    auto description = util::ValidateDescription(req.description());

    auto match = ctx_.matches->CreateMatch(description, req.user_id());

    CreateMatchResponse resp;
    *resp.mutable_view() = ToView(match, req.user_id());
    return resp;
  });
}

GetMatchResponse TimerService::GetMatch(const GetMatchRequest& req) {
  return ObserveRequest("TimerService.GetMatch", req.user_id(), [&] {
    auto id    = CanonicalMatchId(req.match_id());
    auto match = LoadCurrent(*ctx_.matches, id);

    TIMEKEEPER_LOG_INFO("match loaded", {StringField("match_id", id),
                                         ClockField("clock", match.timer_state.seconds_remaining)});

    GetMatchResponse resp;
    *resp.mutable_view() = ToView(match, req.user_id());
    return resp;
  });
}

ControlTimerResponse TimerService::ControlTimer(const ControlTimerRequest& req) {
  return ObserveRequest("TimerService.ControlTimer", req.user_id(), [&] {
    auto id     = CanonicalMatchId(req.match_id());
    auto stored = ctx_.matches->GetMatch(id);
    if (!stored) {
      throw util::NotFound("match " + id + " not found");
    }
    if (!access::CanControlTimer(req.user_id(), *stored)) {
      throw util::PermissionDenied("only the match admin can control the timer");
    }

    const auto op      = timer::ParseTimerOperation(req.operation());
    auto       current = ctx_.matches->Refresh(*stored);
    auto       updated = ctx_.matches->ApplyTimerOperation(current, op);
    ctx_.matches->UpdateMatch(updated);

    TIMEKEEPER_LOG_INFO("timer operation applied",
                        {StringField("match_id", id), StringField("operation", timer::ToString(op)),
                         ClockField("clock", updated.timer_state.seconds_remaining)});

    ControlTimerResponse resp;
    *resp.mutable_view() = ToView(updated, req.user_id());
    return resp;
  });
}

void TimerService::DeleteMatch(const DeleteMatchRequest& req) {
  ObserveRequest("TimerService.DeleteMatch", req.user_id(), [&] {
    auto id    = CanonicalMatchId(req.match_id());
    auto match = ctx_.matches->GetMatch(id);
    if (!match) {
      throw util::NotFound("match " + id + " not found");
    }
    if (!access::IsAdmin(req.user_id(), *match)) {
      throw util::PermissionDenied("only the match admin can delete the match");
    }
    ctx_.matches->DeleteMatch(id);
  });
}

FollowMatchResponse TimerService::FollowMatch(const FollowMatchRequest& req) {
  return ObserveRequest("TimerService.FollowMatch", req.user_id(), [&] {
    util::ValidateUserId(req.user_id());

    auto extracted = util::ExtractMatchIdFromScan(req.match_ref());
    if (!extracted) {
      throw util::ValidationFailure("'" + req.match_ref() + "' does not contain a match id");
    }
    auto id    = CanonicalMatchId(*extracted);
    auto match = LoadCurrent(*ctx_.matches, id);

    ctx_.follows->Follow(req.user_id(), id);

    FollowMatchResponse resp;
    *resp.mutable_view() = ToView(match, req.user_id());
    return resp;
  });
}

void TimerService::UnfollowMatch(const UnfollowMatchRequest& req) {
  ObserveRequest("TimerService.UnfollowMatch", req.user_id(), [&] {
    util::ValidateUserId(req.user_id());
    ctx_.follows->Unfollow(req.user_id(), CanonicalMatchId(req.match_id()));
  });
}

ListActiveMatchesResponse TimerService::ListActiveMatches(const ListActiveMatchesRequest& req) {
  return ObserveRequest("TimerService.ListActiveMatches", req.user_id(), [&] {
    util::ValidateUserId(req.user_id());

    ListActiveMatchesResponse resp;
    for (const auto& stored : ctx_.matches->ListActiveMatches(ctx_.follows->FollowedMatches(req.user_id()))) {
      auto current = ctx_.matches->Refresh(stored);
      if (current != stored) {
        ctx_.matches->UpdateMatch(current);
      }
      *resp.add_matches() = ToView(current, req.user_id());
    }
    return resp;
  });
}

} // namespace timekeeper::service

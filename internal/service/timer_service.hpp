#pragma once

#include "internal/service/service_context.hpp"
#include "timekeeper/v1.hpp"

namespace timekeeper::service {

/*
  Request orchestration for the match timer API.

  Every operation validates its input before touching the store, reconciles
  a loaded match before using it, and persists a match only when something
  changed. Failures are thrown as util:: exceptions; the gRPC layer maps them.
*/
class TimerService {
 public:
  explicit TimerService(ServiceContext ctx);

  timekeeper::v1::CreateMatchResponse CreateMatch(const timekeeper::v1::CreateMatchRequest& req);

  timekeeper::v1::GetMatchResponse GetMatch(const timekeeper::v1::GetMatchRequest& req);

  // Admin only. The clock is reconciled before the operation so running
  // time up to now is kept.
  timekeeper::v1::ControlTimerResponse ControlTimer(const timekeeper::v1::ControlTimerRequest& req);

  // Admin only soft delete.
  void DeleteMatch(const timekeeper::v1::DeleteMatchRequest& req);

  // match_ref is raw scanned or typed text; the match must exist.
  timekeeper::v1::FollowMatchResponse FollowMatch(const timekeeper::v1::FollowMatchRequest& req);

  void UnfollowMatch(const timekeeper::v1::UnfollowMatchRequest& req);

  // Followed matches that are still active, in follow order.
  timekeeper::v1::ListActiveMatchesResponse ListActiveMatches(const timekeeper::v1::ListActiveMatchesRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace timekeeper::service

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/match.hpp"
#include "internal/model/timer_phase.hpp"
#include "internal/util/time.hpp"

namespace timekeeper::store {
class RecordStore;
}

namespace timekeeper::core {

/*
  Match lifecycle on top of the record store.

  Nothing here caches records: every call goes to the store, and a record
  read from it is stale until Refresh() reconciles its timer against the
  wall clock.
*/
class MatchManager {
 public:
  using Clock = std::function<util::TimePoint()>;

  explicit MatchManager(std::shared_ptr<store::RecordStore> store, Clock clock = util::Now);

  // Callers validate description and admin id first.
  model::Match CreateMatch(const std::string& description, const std::string& admin_id);

  std::optional<model::Match> GetMatch(const std::string& match_id);

  // Last write wins.
  void UpdateMatch(const model::Match& match);

  // Soft delete. No-op for an unknown id.
  void DeleteMatch(const std::string& match_id);

  // Active matches among ids, in the order given. Unknown and inactive ids
  // are skipped.
  std::vector<model::Match> ListActiveMatches(const std::vector<std::string>& match_ids);

  // Catches the timer up to now. Does not persist.
  model::Match Refresh(model::Match match) const;

  // Pure; throws util::InactiveMatchOperation for an inactive match.
  model::Match ApplyTimerOperation(model::Match match, model::TimerOperation op) const;

  util::TimePoint Now() const;

 private:
  std::shared_ptr<store::RecordStore> store_;
  Clock                               clock_;
};

} // namespace timekeeper::core

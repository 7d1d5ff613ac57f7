#include "record_store.hpp"

#include <stdexcept>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace timekeeper::store {

namespace {

[[noreturn]] void Rethrow(const db::Result& result, const std::string& prefix) {
  switch (result.code) {
    case db::ErrorCode::Corruption:
    case db::ErrorCode::ConstraintViolation:
      throw util::StoreCorrupted(prefix + ": " + result.message);
    default:
      throw util::StoreUnavailable(prefix + ": " + result.message);
  }
}

void ThrowIfDbError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  Rethrow(result, prefix);
}

// Runs fn and turns backend exceptions into store exceptions.
template <typename Fn>
auto Guard(const std::string& prefix, Fn&& fn) {
  try {
    return fn();
  } catch (const db::DbError& e) {
    Rethrow(e.AsResult(), prefix);
  }
}

util::TimePoint ParseTimestamp(const std::string& text, const std::string& match_id, const char* field) {
  try {
    return util::FromIso8601(text);
  } catch (const std::invalid_argument&) {
    throw util::StoreCorrupted("match " + match_id + ": malformed " + field + " '" + text + "'");
  }
}

db::model::MatchRecord ToMatchRecord(const model::Match& match) {
  db::model::MatchRecord r;
  r.match_id          = match.match_id;
  r.description       = match.description;
  r.admin_id          = match.admin_id;
  r.seconds_remaining = match.timer_state.seconds_remaining;
  r.is_running        = match.timer_state.is_running;
  r.last_update       = util::ToIso8601(match.timer_state.last_update);
  r.total_paused_time = match.timer_state.total_paused_time;
  r.created_at        = util::ToIso8601(match.created_at);
  r.is_active         = match.is_active;
  return r;
}

model::Match FromMatchRecord(const db::model::MatchRecord& r) {
  if (r.seconds_remaining < 0 || r.seconds_remaining > model::kMatchDurationSeconds) {
    throw util::StoreCorrupted("match " + r.match_id + ": seconds_remaining out of range (" +
                               std::to_string(r.seconds_remaining) + ")");
  }

  model::Match m;
  m.match_id                      = r.match_id;
  m.description                   = r.description;
  m.admin_id                      = r.admin_id;
  m.timer_state.seconds_remaining = r.seconds_remaining;
  m.timer_state.is_running        = r.is_running;
  m.timer_state.last_update       = ParseTimestamp(r.last_update, r.match_id, "last_update");
  m.timer_state.total_paused_time = r.total_paused_time;
  m.created_at                    = ParseTimestamp(r.created_at, r.match_id, "created_at");
  m.is_active                     = r.is_active;
  return m;
}

db::model::FollowListRecord ToFollowListRecord(const model::FollowList& list) {
  return {list.user_id, list.match_list};
}

model::FollowList FromFollowListRecord(const db::model::FollowListRecord& r) {
  return {r.user_id, r.match_list};
}

} // namespace

RecordStore::RecordStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("record store requires a repository");
  }
}

void RecordStore::SaveMatch(const model::Match& match) {
  Guard("save match " + match.match_id, [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->UpsertMatch(*tx, ToMatchRecord(match)), "save match " + match.match_id);
    tx->Commit();
  });
}

std::optional<model::Match> RecordStore::LoadMatch(const std::string& match_id) {
  auto record = Guard("load match " + match_id, [&] {
    auto tx     = repository_->BeginRead();
    auto result = repository_->GetMatch(*tx, match_id);
    tx->Commit();
    return result;
  });

  if (!record) {
    return std::nullopt;
  }
  return FromMatchRecord(*record);
}

std::vector<model::Match> RecordStore::ListAllMatches() {
  auto records = Guard("list matches", [&] {
    auto tx     = repository_->BeginRead();
    auto result = repository_->ListMatches(*tx);
    tx->Commit();
    return result;
  });

  std::vector<model::Match> matches;
  matches.reserve(records.size());
  for (const auto& r : records) {
    matches.push_back(FromMatchRecord(r));
  }
  return matches;
}

void RecordStore::SaveFollowList(const model::FollowList& list) {
  Guard("save follow list " + list.user_id, [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->UpsertFollowList(*tx, ToFollowListRecord(list)), "save follow list " + list.user_id);
    tx->Commit();
  });
}

std::optional<model::FollowList> RecordStore::LoadFollowList(const std::string& user_id) {
  auto record = Guard("load follow list " + user_id, [&] {
    auto tx     = repository_->BeginRead();
    auto result = repository_->GetFollowList(*tx, user_id);
    tx->Commit();
    return result;
  });

  if (!record) {
    return std::nullopt;
  }
  return FromFollowListRecord(*record);
}

model::FollowList RecordStore::UpdateFollowList(const std::string&                              user_id,
                                                const std::function<void(model::FollowList&)>& mutation) {
  return Guard("update follow list " + user_id, [&] {
    auto tx = repository_->Begin();

    model::FollowList list{user_id, {}};
    if (auto existing = repository_->GetFollowList(*tx, user_id)) {
      list = FromFollowListRecord(*existing);
    }

    mutation(list);
    list.user_id = user_id;

    ThrowIfDbError(repository_->UpsertFollowList(*tx, ToFollowListRecord(list)), "update follow list " + user_id);
    tx->Commit();

    TIMEKEEPER_LOG_DEBUG("follow list updated", {observability::StringField("user_id", user_id),
                                                 observability::IntField("matches", static_cast<std::int64_t>(list.match_list.size()))});
    return list;
  });
}

} // namespace timekeeper::store

#include "file_repository.hpp"

#include <algorithm>
#include <system_error>

#include "file_tx.hpp"

namespace timekeeper::db::file {

using timekeeper::store::v1::MatchEntry;
using timekeeper::store::v1::UserEntry;

namespace {

FileTransaction& TX(db::Transaction& tx) {
  return static_cast<FileTransaction&>(tx);
}

MatchEntry ToEntry(const model::MatchRecord& r) {
  MatchEntry e;
  e.set_match_id(r.match_id);
  e.set_description(r.description);
  e.set_admin_id(r.admin_id);
  auto* timer = e.mutable_timer_state();
  timer->set_seconds_remaining(r.seconds_remaining);
  timer->set_is_running(r.is_running);
  timer->set_last_update(r.last_update);
  timer->set_total_paused_time(r.total_paused_time);
  e.set_created_at(r.created_at);
  e.set_is_active(r.is_active);
  return e;
}

model::MatchRecord FromEntry(const MatchEntry& e) {
  model::MatchRecord r;
  r.match_id          = e.match_id();
  r.description       = e.description();
  r.admin_id          = e.admin_id();
  r.seconds_remaining = e.timer_state().seconds_remaining();
  r.is_running        = e.timer_state().is_running();
  r.last_update       = e.timer_state().last_update();
  r.total_paused_time = e.timer_state().total_paused_time();
  r.created_at        = e.created_at();
  r.is_active         = e.is_active();
  return r;
}

} // namespace

FileRepository::FileRepository(std::filesystem::path path) : path_(std::move(path)) {
  lock_path_ = path_;
  lock_path_ += ".lock";

  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw DbError(ErrorCode::IOError, "create store directory " + path_.parent_path().string() + ": " + ec.message());
    }
  }

  FileTransaction init(path_, lock_path_, FileTransaction::Mode::kCreate);
  init.Commit();
}

std::unique_ptr<db::Transaction> FileRepository::BeginRead() {
  return std::make_unique<FileTransaction>(path_, lock_path_, FileTransaction::Mode::kRead);
}

std::unique_ptr<db::Transaction> FileRepository::Begin() {
  return std::make_unique<FileTransaction>(path_, lock_path_, FileTransaction::Mode::kWrite);
}

Result FileRepository::UpsertMatch(Transaction& t, const model::MatchRecord& r) {
  if (r.match_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "match id is empty");
  (*TX(t).Mutable().mutable_matches())[r.match_id] = ToEntry(r);
  return Result::Ok();
}

std::optional<model::MatchRecord> FileRepository::GetMatch(Transaction& t, const std::string& id) {
  const auto& matches = TX(t).View().matches();
  auto        it      = matches.find(id);
  if (it == matches.end()) return std::nullopt;
  return FromEntry(it->second);
}

std::vector<model::MatchRecord> FileRepository::ListMatches(Transaction& t) {
  const auto&                     matches = TX(t).View().matches();
  std::vector<model::MatchRecord> records;
  records.reserve(matches.size());
  for (const auto& [_, entry] : matches) {
    records.push_back(FromEntry(entry));
  }
  std::sort(records.begin(), records.end(),
            [](const model::MatchRecord& a, const model::MatchRecord& b) { return a.match_id < b.match_id; });
  return records;
}

Result FileRepository::UpsertFollowList(Transaction& t, const model::FollowListRecord& r) {
  if (r.user_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "user id is empty");

  UserEntry entry;
  entry.set_user_id(r.user_id);
  for (const auto& id : r.match_list) {
    entry.add_match_list(id);
  }
  (*TX(t).Mutable().mutable_users())[r.user_id] = std::move(entry);
  return Result::Ok();
}

std::optional<model::FollowListRecord> FileRepository::GetFollowList(Transaction& t, const std::string& user_id) {
  const auto& users = TX(t).View().users();
  auto        it    = users.find(user_id);
  if (it == users.end()) return std::nullopt;

  model::FollowListRecord r;
  r.user_id = it->second.user_id().empty() ? user_id : it->second.user_id();
  r.match_list.assign(it->second.match_list().begin(), it->second.match_list().end());
  return r;
}

} // namespace timekeeper::db::file

#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace timekeeper::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, /*writable=*/false);
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, /*writable=*/true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertMatch(Transaction& t, const model::MatchRecord& r) {
  if (r.match_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "match id is empty");
  TX(t).Mutable().matches[r.match_id] = r;
  return Result::Ok();
}

std::optional<model::MatchRecord> MemoryRepository::GetMatch(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.matches.find(id);
  if (it == s.matches.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MatchRecord> MemoryRepository::ListMatches(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::MatchRecord> records;
  records.reserve(s.matches.size());
  for (const auto& [_, record] : s.matches) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpsertFollowList(Transaction& t, const model::FollowListRecord& r) {
  if (r.user_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "user id is empty");
  TX(t).Mutable().users[r.user_id] = r;
  return Result::Ok();
}

std::optional<model::FollowListRecord> MemoryRepository::GetFollowList(Transaction& t, const std::string& user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.users.find(user_id);
  if (it == s.users.end()) return std::nullopt;
  return it->second;
}

} // namespace timekeeper::db::memory

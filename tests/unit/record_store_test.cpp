#include "internal/store/record_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/file/file_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/timer/timer_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace std::chrono_literals;
using timekeeper::model::FollowList;
using timekeeper::model::Match;
using timekeeper::store::RecordStore;

std::filesystem::path TempStorePath(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "timekeeper_record_store_tests" / test_name;
  std::filesystem::remove_all(dir);
  return dir / "storage.json";
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

Match SampleMatch(const std::string& admin) {
  const auto now = timekeeper::util::Now();

  Match m;
  m.match_id    = timekeeper::util::ToString(timekeeper::util::GenerateUUID());
  m.description = "Final";
  m.admin_id    = admin;
  m.timer_state = timekeeper::timer::Resume(timekeeper::timer::Initialize(now), now);
  m.timer_state.seconds_remaining = 4321;
  m.created_at  = now - 90s;
  m.is_active   = true;
  return m;
}

bool Close(timekeeper::util::TimePoint a, timekeeper::util::TimePoint b) {
  return (a > b ? a - b : b - a) < 1ms;
}

void AssertSameMatch(const Match& a, const Match& b) {
  assert(a.match_id == b.match_id);
  assert(a.description == b.description);
  assert(a.admin_id == b.admin_id);
  assert(a.timer_state.seconds_remaining == b.timer_state.seconds_remaining);
  assert(a.timer_state.is_running == b.timer_state.is_running);
  assert(a.timer_state.total_paused_time == b.timer_state.total_paused_time);
  assert(Close(a.timer_state.last_update, b.timer_state.last_update));
  assert(Close(a.created_at, b.created_at));
  assert(a.is_active == b.is_active);
}

template <typename Exception>
bool Throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void VerifyContract(RecordStore& store) {
  auto match = SampleMatch("A1");
  store.SaveMatch(match);

  auto loaded = store.LoadMatch(match.match_id);
  assert(loaded.has_value());
  AssertSameMatch(*loaded, match);

  // upsert overwrites every field
  match.timer_state.is_running = false;
  match.is_active              = false;
  store.SaveMatch(match);
  AssertSameMatch(*store.LoadMatch(match.match_id), match);

  assert(!store.LoadMatch("00000000-0000-4000-8000-000000000000").has_value());

  auto other = SampleMatch("B2");
  store.SaveMatch(other);
  assert(store.ListAllMatches().size() == 2);

  FollowList list{"viewer", {other.match_id, match.match_id}};
  store.SaveFollowList(list);
  auto loaded_list = store.LoadFollowList("viewer");
  assert(loaded_list.has_value());
  assert(*loaded_list == list);

  assert(!store.LoadFollowList("nobody").has_value());

  auto updated = store.UpdateFollowList("viewer", [](FollowList& l) { l.match_list.push_back("third"); });
  assert(updated.match_list.size() == 3);
  assert(updated.match_list.back() == "third");
  assert(store.LoadFollowList("viewer")->match_list == updated.match_list);

  auto fresh = store.UpdateFollowList("newcomer", [](FollowList& l) {
    assert(l.match_list.empty());
    l.match_list.push_back("x");
  });
  assert(fresh.user_id == "newcomer");
  assert(store.LoadFollowList("newcomer")->match_list.size() == 1);
}

void TestMemoryBackendContract() {
  RecordStore store(std::make_shared<timekeeper::db::memory::MemoryRepository>());
  VerifyContract(store);
}

void TestFileBackendContract() {
  const auto path = TempStorePath("contract");
  RecordStore store(std::make_shared<timekeeper::db::file::FileRepository>(path));
  assert(std::filesystem::exists(path));
  VerifyContract(store);
  assert(!std::filesystem::exists(path.string() + ".tmp"));
}

void TestFileBackendSurvivesReopen() {
  const auto path  = TempStorePath("reopen");
  auto       match = SampleMatch("A1");
  {
    RecordStore store(std::make_shared<timekeeper::db::file::FileRepository>(path));
    store.SaveMatch(match);
  }
  RecordStore reopened(std::make_shared<timekeeper::db::file::FileRepository>(path));
  AssertSameMatch(*reopened.LoadMatch(match.match_id), match);
}

void TestFileBackendWritesReadableJson() {
  const auto  path = TempStorePath("layout");
  RecordStore store(std::make_shared<timekeeper::db::file::FileRepository>(path));
  auto        match = SampleMatch("A1");
  store.SaveMatch(match);
  store.SaveFollowList({"A1", {match.match_id}});

  std::ifstream in(path);
  std::string   json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  for (const char* key : {"\"matches\"", "\"users\"", "\"timer_state\"", "\"seconds_remaining\": 4321", "\"last_update\"",
                          "\"match_list\"", "\"is_active\": true"}) {
    assert(json.find(key) != std::string::npos);
  }
}

void TestMalformedFileIsCorruption() {
  const auto  path = TempStorePath("malformed");
  RecordStore store(std::make_shared<timekeeper::db::file::FileRepository>(path));

  WriteFile(path, "{ this is not json");
  assert(Throws<timekeeper::util::StoreCorrupted>([&] { (void)store.LoadMatch("any"); }));
  assert(Throws<timekeeper::util::StoreCorrupted>([&] { store.SaveMatch(SampleMatch("A1")); }));

  WriteFile(path, "");
  assert(Throws<timekeeper::util::StoreCorrupted>([&] { (void)store.ListAllMatches(); }));
}

void TestBadFieldValuesAreCorruption() {
  const auto  path = TempStorePath("bad_fields");
  RecordStore store(std::make_shared<timekeeper::db::file::FileRepository>(path));

  const std::string id = "3f2b8c1e-9d4a-4b7e-8f1a-2c3d4e5f6a7b";
  WriteFile(path, R"({"matches": {")" + id + R"(": {"match_id": ")" + id + R"(", "description": "Final", "admin_id": "A1",
      "timer_state": {"seconds_remaining": 5400, "is_running": false, "last_update": "yesterday", "total_paused_time": 0},
      "created_at": "2024-05-01T18:30:00Z", "is_active": true}}, "users": {}})");
  assert(Throws<timekeeper::util::StoreCorrupted>([&] { (void)store.LoadMatch(id); }));

  WriteFile(path, R"({"matches": {")" + id + R"(": {"match_id": ")" + id + R"(", "description": "Final", "admin_id": "A1",
      "timer_state": {"seconds_remaining": -4, "is_running": false, "last_update": "2024-05-01T18:30:00Z", "total_paused_time": 0},
      "created_at": "2024-05-01T18:30:00Z", "is_active": true}}, "users": {}})");
  assert(Throws<timekeeper::util::StoreCorrupted>([&] { (void)store.LoadMatch(id); }));
}

void TestMissingFileIsUnavailable() {
  const auto  path = TempStorePath("missing");
  RecordStore store(std::make_shared<timekeeper::db::file::FileRepository>(path));

  std::filesystem::remove(path);
  assert(Throws<timekeeper::util::StoreUnavailable>([&] { (void)store.LoadMatch("any"); }));
}

} // namespace

int main() {
  TestMemoryBackendContract();
  TestFileBackendContract();
  TestFileBackendSurvivesReopen();
  TestFileBackendWritesReadableJson();
  TestMalformedFileIsCorruption();
  TestBadFieldValuesAreCorruption();
  TestMissingFileIsUnavailable();

  std::cout << "timekeeper_unit_record_store: pass\n";
  return 0;
}

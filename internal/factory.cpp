#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include "internal/core/follow_manager.hpp"
#include "internal/core/match_manager.hpp"
#include "internal/db/file/file_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/grpc/timer_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/timer_service.hpp"
#include "internal/store/record_store.hpp"

namespace timekeeper::factory {

using namespace timekeeper;
using observability::StringField;
using timekeeper::runtime::config::StoreConfig;

namespace {

void EnsureParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("create directory " + parent.string() + ": " + ec.message());
  }
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const timekeeper::runtime::config::RuntimeConfig& config) {
  const auto& store = config.store();
  switch (store.backend_case()) {
    case StoreConfig::kSqlite: {
      EnsureParentDirectory(store.sqlite().path());
      auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(store.sqlite().path(), store.sqlite().wal_mode());
      TIMEKEEPER_LOG_INFO("store opened", {StringField("backend", "sqlite"), StringField("path", store.sqlite().path())});
      return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    }

    case StoreConfig::kMemory:
      TIMEKEEPER_LOG_INFO("store opened", {StringField("backend", "memory")});
      return std::make_shared<db::memory::MemoryRepository>();

    case StoreConfig::kFile:
      TIMEKEEPER_LOG_INFO("store opened", {StringField("backend", "file"), StringField("path", store.file().path())});
      return std::make_shared<db::file::FileRepository>(store.file().path());

    case StoreConfig::BACKEND_NOT_SET:
      break;
  }
  throw std::runtime_error("no store backend configured");
}

/*
    Build full application dependency graph
*/
Application Build(const timekeeper::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository    = BuildRepository(config);
  auto record_store = std::make_shared<store::RecordStore>(app.repository);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.matches = std::make_shared<core::MatchManager>(record_store);
  ctx.follows = std::make_shared<core::FollowManager>(record_store);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  auto timer_service = std::make_shared<service::TimerService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::TimerServer>(timer_service));

  return app;
}

} // namespace timekeeper::factory

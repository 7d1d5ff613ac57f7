#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/follow_manager.hpp"
#include "internal/core/match_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/timer_server.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/timer_service.hpp"
#include "internal/store/record_store.hpp"
#include "internal/util/errors.hpp"
#include "timekeeper/v1.hpp"

namespace {

timekeeper::grpc::TimerServer BuildServer() {
  auto store = std::make_shared<timekeeper::store::RecordStore>(std::make_shared<timekeeper::db::memory::MemoryRepository>());

  timekeeper::service::ServiceContext ctx;
  ctx.matches = std::make_shared<timekeeper::core::MatchManager>(store);
  ctx.follows = std::make_shared<timekeeper::core::FollowManager>(store);
  return timekeeper::grpc::TimerServer(std::make_shared<timekeeper::service::TimerService>(ctx));
}

std::string CreateMatch(timekeeper::grpc::TimerServer& server, const std::string& user) {
  timekeeper::v1::CreateMatchRequest req;
  req.set_user_id(user);
  req.set_description("Final");
  timekeeper::v1::CreateMatchResponse resp;
  ::grpc::ServerContext               grpc_ctx;

  const auto status = server.CreateMatch(&grpc_ctx, &req, &resp);
  assert(status.ok());
  return resp.view().match().match_id();
}

void TestEveryErrorHasItsOwnCode() {
  using namespace timekeeper::util;
  using timekeeper::grpc::ToStatus;

  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(ValidationFailure("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(UnknownOperation("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(InactiveMatchOperation("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(PermissionDenied("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(StoreUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(StoreCorrupted("x")).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(NotFound("match gone")).error_message() == "match gone");
}

void TestGetMissingMatchReturnsNotFound() {
  auto server = BuildServer();

  timekeeper::v1::GetMatchRequest req;
  req.set_user_id("viewer");
  req.set_match_id("3f2b8c1e-9d4a-4b7e-8f1a-2c3d4e5f6a7b");
  timekeeper::v1::GetMatchResponse resp;
  ::grpc::ServerContext            grpc_ctx;

  const auto status = server.GetMatch(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestSpectatorControlReturnsPermissionDenied() {
  auto server = BuildServer();
  auto id     = CreateMatch(server, "A1");

  timekeeper::v1::ControlTimerRequest req;
  req.set_user_id("viewer");
  req.set_match_id(id);
  req.set_operation("resume");
  timekeeper::v1::ControlTimerResponse resp;
  ::grpc::ServerContext                grpc_ctx;

  const auto status = server.ControlTimer(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

void TestStoppedMatchReturnsFailedPrecondition() {
  auto server = BuildServer();
  auto id     = CreateMatch(server, "A1");

  timekeeper::v1::ControlTimerRequest req;
  req.set_user_id("A1");
  req.set_match_id(id);
  req.set_operation("stop");
  timekeeper::v1::ControlTimerResponse resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server.ControlTimer(&grpc_ctx, &req, &resp).ok());
  }

  req.set_operation("resume");
  ::grpc::ServerContext grpc_ctx;
  const auto            status = server.ControlTimer(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestMalformedIdReturnsInvalidArgument() {
  auto server = BuildServer();

  timekeeper::v1::DeleteMatchRequest req;
  req.set_user_id("A1");
  req.set_match_id("42");
  google::protobuf::Empty resp;
  ::grpc::ServerContext   grpc_ctx;

  const auto status = server.DeleteMatch(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestEveryErrorHasItsOwnCode();
  TestGetMissingMatchReturnsNotFound();
  TestSpectatorControlReturnsPermissionDenied();
  TestStoppedMatchReturnsFailedPrecondition();
  TestMalformedIdReturnsInvalidArgument();

  std::cout << "timekeeper_unit_grpc_status: pass\n";
  return 0;
}

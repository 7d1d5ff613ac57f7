#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/timer_service.hpp"
#include "timekeeper/v1.hpp"

namespace timekeeper::grpc {

class TimerServer final : public timekeeper::v1::MatchTimerService::Service {
public:
  explicit TimerServer(std::shared_ptr<timekeeper::service::TimerService> svc);

  ::grpc::Status CreateMatch(::grpc::ServerContext*,
                             const timekeeper::v1::CreateMatchRequest*,
                             timekeeper::v1::CreateMatchResponse*) override;

  ::grpc::Status GetMatch(::grpc::ServerContext*,
                          const timekeeper::v1::GetMatchRequest*,
                          timekeeper::v1::GetMatchResponse*) override;

  ::grpc::Status ControlTimer(::grpc::ServerContext*,
                              const timekeeper::v1::ControlTimerRequest*,
                              timekeeper::v1::ControlTimerResponse*) override;

  ::grpc::Status DeleteMatch(::grpc::ServerContext*,
                             const timekeeper::v1::DeleteMatchRequest*,
                             google::protobuf::Empty*) override;

  ::grpc::Status FollowMatch(::grpc::ServerContext*,
                             const timekeeper::v1::FollowMatchRequest*,
                             timekeeper::v1::FollowMatchResponse*) override;

  ::grpc::Status UnfollowMatch(::grpc::ServerContext*,
                               const timekeeper::v1::UnfollowMatchRequest*,
                               google::protobuf::Empty*) override;

  ::grpc::Status ListActiveMatches(::grpc::ServerContext*,
                                   const timekeeper::v1::ListActiveMatchesRequest*,
                                   timekeeper::v1::ListActiveMatchesResponse*) override;

private:
  std::shared_ptr<timekeeper::service::TimerService> service_;
};

}

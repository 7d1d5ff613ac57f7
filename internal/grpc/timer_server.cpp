#include "timer_server.hpp"
#include "grpc_error.hpp"

namespace timekeeper::grpc {

TimerServer::TimerServer(std::shared_ptr<timekeeper::service::TimerService> svc)
    : service_(std::move(svc)) {}

::grpc::Status TimerServer::CreateMatch(::grpc::ServerContext*,
                                        const timekeeper::v1::CreateMatchRequest* req,
                                        timekeeper::v1::CreateMatchResponse* resp) {
  try {
    *resp = service_->CreateMatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TimerServer::GetMatch(::grpc::ServerContext*,
                                     const timekeeper::v1::GetMatchRequest* req,
                                     timekeeper::v1::GetMatchResponse* resp) {
  try {
    *resp = service_->GetMatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TimerServer::ControlTimer(::grpc::ServerContext*,
                                         const timekeeper::v1::ControlTimerRequest* req,
                                         timekeeper::v1::ControlTimerResponse* resp) {
  try {
    *resp = service_->ControlTimer(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TimerServer::DeleteMatch(::grpc::ServerContext*,
                                        const timekeeper::v1::DeleteMatchRequest* req,
                                        google::protobuf::Empty*) {
  try {
    service_->DeleteMatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TimerServer::FollowMatch(::grpc::ServerContext*,
                                        const timekeeper::v1::FollowMatchRequest* req,
                                        timekeeper::v1::FollowMatchResponse* resp) {
  try {
    *resp = service_->FollowMatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TimerServer::UnfollowMatch(::grpc::ServerContext*,
                                          const timekeeper::v1::UnfollowMatchRequest* req,
                                          google::protobuf::Empty*) {
  try {
    service_->UnfollowMatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TimerServer::ListActiveMatches(::grpc::ServerContext*,
                                              const timekeeper::v1::ListActiveMatchesRequest* req,
                                              timekeeper::v1::ListActiveMatchesResponse* resp) {
  try {
    *resp = service_->ListActiveMatches(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}

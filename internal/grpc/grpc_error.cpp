#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace timekeeper::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace timekeeper::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const ValidationFailure*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const UnknownOperation*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InactiveMatchOperation*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const StoreUnavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const StoreCorrupted*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace timekeeper::grpc

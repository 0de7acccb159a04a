#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace telemetry::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace telemetry::util;

  if (dynamic_cast<const InvalidSelection*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const EmptyRecording*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const SubscriptionError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace telemetry::grpc

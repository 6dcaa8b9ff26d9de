#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace receiver::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace receiver::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const Unauthorized*>(&e) || dynamic_cast<const CredentialInvalid*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }
  if (dynamic_cast<const Forbidden*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const AlreadyRevoked*>(&e) || dynamic_cast<const DispatchRejected*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Unavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  // DelegationFailed, RevocationFailed and anything unexpected
  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace receiver::grpc

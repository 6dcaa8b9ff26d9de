#pragma once

#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/service/service_context.hpp"

namespace receiver::grpc {

inline constexpr char kAuthTokenHeader[]  = "x-auth-token";
inline constexpr char kApiVersionHeader[] = "x-receiver-api-version";
inline constexpr char kRequestIdHeader[]  = "x-request-id";

// Accepts "1" and "1.<minor>"; anything else is util::InvalidArgument.
void CheckApiVersion(const std::string& version);

/*
  Reads caller metadata, validates the API version and attaches the
  x-request-id initial metadata (client value echoed, else generated).
*/
receiver::service::CallContext ReadCallContext(::grpc::ServerContext* context);

} // namespace receiver::grpc

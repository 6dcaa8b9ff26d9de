#include "request_metadata.hpp"

#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace receiver::grpc {

namespace {

std::string FindMetadata(const ::grpc::ServerContext* context, const char* key) {
  const auto& metadata = context->client_metadata();
  auto        it       = metadata.find(key);
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

bool IsDigits(const std::string& value) {
  if (value.empty()) {
    return false;
  }
  for (unsigned char c : value) {
    if (!std::isdigit(c)) {
      return false;
    }
  }
  return true;
}

} // namespace

void CheckApiVersion(const std::string& version) {
  const auto dot   = version.find('.');
  const auto major = version.substr(0, dot);
  const auto minor = dot == std::string::npos ? std::string("0") : version.substr(dot + 1);
  if (major != "1" || !IsDigits(minor)) {
    throw receiver::util::InvalidArgument("Invalid value '" + version + "' specified for '" + kApiVersionHeader + "'");
  }
}

receiver::service::CallContext ReadCallContext(::grpc::ServerContext* context) {
  receiver::service::CallContext call;
  call.auth_token = FindMetadata(context, kAuthTokenHeader);
  call.request_id = FindMetadata(context, kRequestIdHeader);
  if (call.request_id.empty()) {
    call.request_id = "req-" + receiver::util::NewId();
  }
  context->AddInitialMetadata(kRequestIdHeader, call.request_id);

  const auto version = FindMetadata(context, kApiVersionHeader);
  if (!version.empty()) {
    CheckApiVersion(version);
  }
  return call;
}

} // namespace receiver::grpc

#include "internal/observability/resource.hpp"

#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace receiver::observability {

namespace {

std::string StoreBackend(const receiver::runtime::config::DatabaseConfig& database) {
  switch (database.backend_case()) {
    case receiver::runtime::config::DatabaseConfig::kSqlite:
      return "sqlite";
    case receiver::runtime::config::DatabaseConfig::kPostgres:
      return "postgres";
    default:
      return "memory";
  }
}

std::string Upper(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

} // namespace

ServiceIdentity ResolveServiceIdentity(const receiver::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  ServiceIdentity identity;
  if (!observability.service_name().empty()) {
    identity.name = observability.service_name();
  }
  if (!observability.service_namespace().empty()) {
    identity.service_namespace = observability.service_namespace();
  }
  identity.environment   = observability.deployment_environment();
  identity.store_backend = StoreBackend(config.database());

  if (const char* instance = std::getenv("RECEIVER_INSTANCE_ID"); instance != nullptr && *instance != '\0') {
    identity.instance_id = instance;
  } else if (!observability.instance_id().empty()) {
    identity.instance_id = observability.instance_id();
  } else {
    identity.instance_id = config.server().bind_address();
  }
  return identity;
}

std::vector<std::pair<std::string, std::string>> ResourceAttributes(const ServiceIdentity& identity) {
  std::vector<std::pair<std::string, std::string>> attributes = {
      {"service.name", identity.name},
      {"service.namespace", identity.service_namespace},
      {"service.version", std::string(kServiceVersion)},
      {"service.instance.id", identity.instance_id},
      {"deployment.environment", identity.environment},
      {"receiver.store.backend", identity.store_backend},
  };

  std::erase_if(attributes, [](const auto& attribute) { return attribute.second.empty(); });
  return attributes;
}

OtlpConfig ResolveOtlpConfig(const receiver::runtime::config::RuntimeConfig& config) {
  OtlpConfig otlp;
  otlp.service  = ResolveServiceIdentity(config);
  otlp.endpoint = config.observability().otlp_endpoint();
  otlp.transport =
      config.observability().transport() == receiver::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const auto per_signal = "OTEL_EXPORTER_OTLP_" + Upper(signal) + "_ENDPOINT";
  if (const char* endpoint = std::getenv(per_signal.c_str())) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return "http://localhost:4318/v1/" + std::string(signal);
  }
  return "localhost:4317";
}

} // namespace receiver::observability

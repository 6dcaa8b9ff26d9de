#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace receiver::runtime::config {
class RuntimeConfig;
}

namespace receiver::observability {

inline constexpr std::string_view kInstrumentationScope = "receiver.manager";
inline constexpr std::string_view kServiceVersion       = "0.1.0";

// Which receiver-manager process emitted a span, metric point or log line.
struct ServiceIdentity {
  std::string name{"receiver-manager"};
  std::string service_namespace{"clustering"};
  std::string instance_id;
  std::string environment;
  std::string store_backend;
};

ServiceIdentity ResolveServiceIdentity(const receiver::runtime::config::RuntimeConfig& config);

// OpenTelemetry resource attributes; empty values are left out.
std::vector<std::pair<std::string, std::string>> ResourceAttributes(const ServiceIdentity& identity);

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  ServiceIdentity service;
  std::string     endpoint;
  OtlpTransport   transport{OtlpTransport::kGrpc};
  bool            insecure{true};
};

OtlpConfig ResolveOtlpConfig(const receiver::runtime::config::RuntimeConfig& config);

// Explicit endpoint, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector's local default.
std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal);

} // namespace receiver::observability

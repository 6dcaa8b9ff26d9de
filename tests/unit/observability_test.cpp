#include <cassert>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/resource.hpp"

namespace {

using receiver::observability::BoolField;
using receiver::observability::FormatLogFields;
using receiver::observability::IntField;
using receiver::observability::StringField;

std::map<std::string, std::string> AttributesOf(const receiver::runtime::config::RuntimeConfig& config) {
  const auto attributes = receiver::observability::ResourceAttributes(receiver::observability::ResolveServiceIdentity(config));
  return {attributes.begin(), attributes.end()};
}

void TestLogFieldsAreQuotedWhenNeeded() {
  assert(FormatLogFields({}) == "");
  assert(FormatLogFields({StringField("receiver_id", "r-1"), IntField("pending", 3), BoolField("webhook", true)}) ==
         "receiver_id=r-1 pending=3 webhook=true");
  assert(FormatLogFields({StringField("error", "trust 't-1' is not usable")}) == R"(error="trust 't-1' is not usable")");
  assert(FormatLogFields({StringField("params", R"(count="2")")}) == R"(params="count=\"2\"")");
  assert(FormatLogFields({StringField("name", "")}) == R"(name="")");
  assert(FormatLogFields({StringField("detail", "line1\nline2")}) == R"(detail="line1\nline2")");
}

void TestSecretFieldsAreRedacted() {
  const auto line = FormatLogFields({StringField("user", "alice"), StringField("token", "alice-token"), StringField("password", "pw")});
  assert(line == "user=alice token=[redacted] password=[redacted]");
  assert(line.find("alice-token") == std::string::npos);

  // ids that merely mention a credential are fine
  assert(FormatLogFields({StringField("trust_id", "t-9")}) == "trust_id=t-9");
}

void TestServiceIdentityDefaults() {
  unsetenv("RECEIVER_INSTANCE_ID");

  receiver::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_bind_address("10.0.0.5:8778");
  config.mutable_database()->mutable_sqlite()->set_path("/tmp/receivers.db");

  const auto attributes = AttributesOf(config);
  assert(attributes.at("service.name") == "receiver-manager");
  assert(attributes.at("service.namespace") == "clustering");
  assert(attributes.at("service.version") == std::string(receiver::observability::kServiceVersion));
  assert(attributes.at("service.instance.id") == "10.0.0.5:8778");
  assert(attributes.at("receiver.store.backend") == "sqlite");
  assert(attributes.count("deployment.environment") == 0);
}

void TestServiceIdentityFromConfigAndEnvironment() {
  receiver::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_bind_address("0.0.0.0:8778");
  auto* observability = config.mutable_observability();
  observability->set_service_name("receiver-manager-eu");
  observability->set_service_namespace("orchestration");
  observability->set_deployment_environment("staging");
  observability->set_instance_id("rm-2");

  unsetenv("RECEIVER_INSTANCE_ID");
  auto attributes = AttributesOf(config);
  assert(attributes.at("service.name") == "receiver-manager-eu");
  assert(attributes.at("service.namespace") == "orchestration");
  assert(attributes.at("deployment.environment") == "staging");
  assert(attributes.at("service.instance.id") == "rm-2");
  assert(attributes.at("receiver.store.backend") == "memory");

  setenv("RECEIVER_INSTANCE_ID", "pod-7f9c", 1);
  attributes = AttributesOf(config);
  assert(attributes.at("service.instance.id") == "pod-7f9c");
  unsetenv("RECEIVER_INSTANCE_ID");
}

void TestOtlpEndpointResolution() {
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");

  receiver::runtime::config::RuntimeConfig config;
  auto otlp = receiver::observability::ResolveOtlpConfig(config);
  assert(receiver::observability::ResolveOtlpEndpoint(otlp, "traces") == "localhost:4317");

  config.mutable_observability()->set_transport(receiver::runtime::config::OTLP_TRANSPORT_HTTP);
  otlp = receiver::observability::ResolveOtlpConfig(config);
  assert(receiver::observability::ResolveOtlpEndpoint(otlp, "metrics") == "http://localhost:4318/v1/metrics");

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://collector:4318", 1);
  setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "http://collector:4318/v1/traces", 1);
  assert(receiver::observability::ResolveOtlpEndpoint(otlp, "traces") == "http://collector:4318/v1/traces");
  assert(receiver::observability::ResolveOtlpEndpoint(otlp, "metrics") == "http://collector:4318");

  config.mutable_observability()->set_otlp_endpoint("http://explicit:4318");
  otlp = receiver::observability::ResolveOtlpConfig(config);
  assert(receiver::observability::ResolveOtlpEndpoint(otlp, "traces") == "http://explicit:4318");

  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
}

} // namespace

int main() {
  TestLogFieldsAreQuotedWhenNeeded();
  TestSecretFieldsAreRedacted();
  TestServiceIdentityDefaults();
  TestServiceIdentityFromConfigAndEnvironment();
  TestOtlpEndpointResolution();

  std::cout << "receiver_manager_unit_observability: pass\n";
  return 0;
}

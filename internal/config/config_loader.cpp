#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

namespace receiver::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("123" is a token, not a number)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static receiver::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  receiver::runtime::config::RuntimeConfig config;
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

receiver::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

receiver::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(node);
}

void ConfigLoader::ApplyDefaults(receiver::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:8778");
  }
  if (config.database().backend_case() == receiver::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_sqlite() && config.database().sqlite().busy_timeout_ms() == 0) {
    config.mutable_database()->mutable_sqlite()->set_busy_timeout_ms(5000);
  }
  if (config.channel().base_url().empty()) {
    config.mutable_channel()->set_base_url("http://localhost:8778");
  }
  if (config.identity().call_timeout_ms() == 0) {
    config.mutable_identity()->set_call_timeout_ms(5000);
  }
  if (config.engine().worker_threads() == 0) {
    config.mutable_engine()->set_worker_threads(2);
  }
  if (config.engine().max_pending_per_cluster() == 0) {
    config.mutable_engine()->set_max_pending_per_cluster(64);
  }
  if (config.api().default_limit() == 0) {
    config.mutable_api()->set_default_limit(100);
  }
  if (config.api().max_limit() == 0) {
    config.mutable_api()->set_max_limit(1000);
  }
}

void ConfigLoader::Validate(const receiver::runtime::config::RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
  if (config.api().default_limit() > config.api().max_limit()) {
    throw std::runtime_error("Invalid configuration: api.default_limit exceeds api.max_limit");
  }

  const auto& base_url = config.channel().base_url();
  if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0) {
    throw std::runtime_error("Invalid configuration: channel.base_url must be an http(s) URL");
  }

  std::set<std::string> tokens;
  for (const auto& user : config.identity().users()) {
    if (user.token().empty() || user.user().empty() || user.project().empty()) {
      throw std::runtime_error("Invalid configuration: identity users need token, user and project");
    }
    if (!tokens.insert(user.token()).second) {
      throw std::runtime_error("Invalid configuration: duplicate identity token for user '" + user.user() + "'");
    }
  }

  std::set<std::string> cluster_ids;
  for (const auto& cluster : config.clusters()) {
    if (cluster.id().empty() || cluster.project().empty()) {
      throw std::runtime_error("Invalid configuration: clusters need id and project");
    }
    if (!cluster_ids.insert(cluster.id()).second) {
      throw std::runtime_error("Invalid configuration: duplicate cluster id '" + cluster.id() + "'");
    }
  }
}

} // namespace receiver::config

#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace fleetlink::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1883" for a password must not become a number)
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
      throw util::ConfigError("Unsupported YAML node");
  }
}

static bool ParseBool(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value == "1" || value == "true" || value == "yes";
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

fleetlink::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  fleetlink::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::ConfigError("Invalid configuration: " + std::string(status.message()));
  }

  ApplyEnvironmentOverrides(config);
  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(fleetlink::runtime::config::RuntimeConfig& config) {
  auto* broker = config.mutable_broker();

  if (const char* host = std::getenv("BROKER_HOST")) {
    broker->set_host(host);
  }
  if (const char* port = std::getenv("BROKER_PORT")) {
    try {
      const auto parsed = std::stoul(port);
      if (parsed == 0 || parsed > 65535) {
        throw std::out_of_range("port");
      }
      broker->set_port(static_cast<uint32_t>(parsed));
    } catch (const std::exception&) {
      throw util::ConfigError("Invalid BROKER_PORT: " + std::string(port));
    }
  }
  if (const char* tls = std::getenv("BROKER_TLS")) {
    broker->set_use_tls(ParseBool(tls));
  }
  if (const char* user = std::getenv("BROKER_USER")) {
    broker->set_username(user);
  }
  if (const char* pass = std::getenv("BROKER_PASS")) {
    broker->set_password(pass);
  }
  if (const char* key = std::getenv("MAP_SERVICE_API_KEY")) {
    config.mutable_map_service()->set_api_key(key);
  }
}

} // namespace fleetlink::config

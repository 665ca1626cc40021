#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace threadnet::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1234" as a pan id, "true" as a name)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

static threadnet::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  threadnet::runtime::config::RuntimeConfig config;

  // an empty document is a valid, all-defaults config
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(&config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

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

  ConfigLoader::ApplyDefaults(&config);

  const double ratio = config.observability().trace_sample_ratio();
  if (!(ratio >= 0.0 && ratio <= 1.0)) {
    throw std::runtime_error("Invalid configuration: observability.trace_sample_ratio must be within [0, 1]");
  }
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

threadnet::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

threadnet::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(threadnet::runtime::config::RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (config->database().backend_case() == threadnet::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config->mutable_database()->mutable_memory();
  }

  auto* discovery = config->mutable_discovery();
  if (discovery->service_type().empty()) {
    discovery->set_service_type(kDefaultMeshcopService);
  }
  if (discovery->resolve_timeout_ms() == 0) {
    discovery->set_resolve_timeout_ms(kDefaultResolveTimeoutMs);
  }
  if (discovery->router_key() == threadnet::runtime::config::ROUTER_KEY_SOURCE_UNSPECIFIED) {
    discovery->set_router_key(threadnet::runtime::config::ROUTER_KEY_SOURCE_EXTENDED_PAN_ID);
  }
  if (discovery->subscriber_queue_depth() == 0) {
    discovery->set_subscriber_queue_depth(kDefaultSubscriberQueue);
  }
  if (discovery->stream_poll_interval_ms() == 0) {
    discovery->set_stream_poll_interval_ms(kDefaultStreamPollMs);
  }

  auto* observability = config->mutable_observability();
  if (observability->service_name().empty()) {
    observability->set_service_name(kDefaultServiceName);
  }
  if (!observability->has_trace_sample_ratio()) {
    observability->set_trace_sample_ratio(1.0);
  }
}

} // namespace threadnet::config

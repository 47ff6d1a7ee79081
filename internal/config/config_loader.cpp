#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace accessres::config {

namespace {

constexpr std::uint64_t kDefaultMaxFrameAgeMs   = 300000;
constexpr std::uint32_t kDefaultRequestTimeout  = 5000;
constexpr const char*   kDefaultAccessLane      = "access";
constexpr const char*   kDefaultEndpoint        = "localhost:50061";
constexpr const char*   kDefaultInternalHosts[] = {"localhost", "127.0.0.1"};

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = std::strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
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
  }
}

std::string YamlToJson(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  if (yaml.IsNull()) {
    json_value.mutable_struct_value();
  } else {
    YamlToProtoValue(yaml, &json_value);
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }
  return json;
}

} // namespace

// ------------------------------------------------------------
// Public loaders
// ------------------------------------------------------------

accessres::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return Parse(YamlToJson(yaml));
}

accessres::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return Parse(YamlToJson(yaml));
}

accessres::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  accessres::runtime::config::RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

// ------------------------------------------------------------
// Internals
// ------------------------------------------------------------

accessres::runtime::config::RuntimeConfig ConfigLoader::Parse(const std::string& json) {
  accessres::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(accessres::runtime::config::RuntimeConfig* config) {
  auto* client = config->mutable_client();
  if (client->endpoint().empty()) {
    client->set_endpoint(kDefaultEndpoint);
  }
  if (client->request_timeout_ms() == 0) {
    client->set_request_timeout_ms(kDefaultRequestTimeout);
  }
  if (client->access_lane().empty()) {
    client->set_access_lane(kDefaultAccessLane);
  }

  auto* policy = config->mutable_policy();
  if (!policy->has_auto_upgrade()) {
    policy->set_auto_upgrade(true);
  }
  if (policy->max_frame_age_ms() == 0) {
    policy->set_max_frame_age_ms(kDefaultMaxFrameAgeMs);
  }
  if (!policy->has_reject_out_of_order()) {
    policy->set_reject_out_of_order(true);
  }
  if (!policy->has_allow_truncated_frames()) {
    policy->set_allow_truncated_frames(true);
  }
  if (policy->internal_hosts().empty()) {
    for (const auto* host : kDefaultInternalHosts) {
      policy->add_internal_hosts(host);
    }
  }
}

void ConfigLoader::Validate(const accessres::runtime::config::RuntimeConfig& config) {
  for (const auto& host : config.policy().internal_hosts()) {
    if (host.empty()) {
      throw accessres::util::InvalidArgument("policy.internal_hosts: empty host entry; remove it or name a host");
    }
  }
  if (config.client().request_timeout_ms() > 600000) {
    throw accessres::util::InvalidArgument("client.request_timeout_ms: must not exceed 600000");
  }
}

} // namespace accessres::config

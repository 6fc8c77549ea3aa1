#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include "internal/sensor/channel_attribute.hpp"
#include "internal/sensor/sensor.hpp"
#include "internal/util/errors.hpp"

namespace jobprobe::config {

using jobprobe::runtime::config::RuntimeConfig;
using jobprobe::util::InputValidationError;

// Channel attribute maps are map<string, string>; their scalars stay text.
constexpr const char* kStringMapKey = "attributes";

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value, bool scalars_as_strings = false);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value, bool scalars_as_strings) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (scalars_as_strings || node.Tag() == "!") {
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

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value, bool scalars_as_strings) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value, scalars_as_strings);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values(), scalars_as_strings);
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        const auto key = it.first.Scalar();
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[key], scalars_as_strings || key == kStringMapKey);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw InputValidationError("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(node);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.sensor().name().empty()) {
    throw InputValidationError("sensor.name is required");
  }
  if (config.sensor().task_identity().empty()) {
    throw InputValidationError("sensor.task_identity is required");
  }

  const auto kind = sensor::ParseSensorKind(config.sensor().kind().empty() ? "generic" : config.sensor().kind());
  if (!kind) {
    throw InputValidationError("sensor.kind must be generic or scheduled_job_with_log, got '" + config.sensor().kind() + "'");
  }

  const auto& source = config.event_log().source();
  if (!source.empty() && source != "agent" && source != "local") {
    throw InputValidationError("event_log.source must be agent or local, got '" + source + "'");
  }

  if (*kind == sensor::SensorKind::kScheduledJobWithLog) {
    if (config.event_log().job_namespace().empty()) {
      throw InputValidationError("event_log.job_namespace is required for scheduled_job_with_log");
    }
    if (config.event_log().primary_log_path().empty()) {
      throw InputValidationError("event_log.primary_log_path is required for scheduled_job_with_log");
    }
  }

  if (config.agent().address().empty()) {
    throw InputValidationError("agent.address is required");
  }
  if (config.agent().has_timeout() && config.agent().timeout().seconds() <= 0 && config.agent().timeout().nanos() <= 0) {
    throw InputValidationError("agent.timeout must be positive");
  }

  const auto names = sensor::ChannelTemplate(*kind);
  for (const auto& [channel, channel_config] : config.channels()) {
    if (std::find(names.begin(), names.end(), channel) == names.end()) {
      throw InputValidationError("channels: sensor kind " + std::string(sensor::ToString(*kind)) + " has no channel '" + channel + "'");
    }
    for (const auto& [attribute, value] : channel_config.attributes()) {
      if (!sensor::ParseChannelAttribute(attribute)) {
        throw InputValidationError("channels." + channel + ": unknown attribute '" + attribute + "'");
      }
      if (value.empty()) {
        throw InputValidationError("channels." + channel + "." + attribute + " is empty");
      }
    }
  }
}

} // namespace jobprobe::config

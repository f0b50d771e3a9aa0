#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace taskpilot::config {

using taskpilot::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultDatabasePath = "taskpilot.db";
constexpr const char* kDefaultHandler      = "general_chat";

constexpr uint32_t kDefaultAcquireAttempts    = 5;
constexpr uint32_t kDefaultInteractionLogSize = 50;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  // Quoted scalars stay strings ("2s", "0042").
  if (node.Tag() != "!") {
    char*        endptr  = nullptr;
    const double numeric = strtod(scalar.c_str(), &endptr);
    if (!scalar.empty() && endptr && *endptr == '\0') {
      value->set_number_value(numeric);
      return;
    }
  }

  value->set_string_value(scalar);
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

void SetDefaultDuration(google::protobuf::Duration* duration, int64_t seconds, int32_t nanos = 0) {
  if (duration->seconds() > 0 || duration->nanos() > 0) {
    return;
  }
  duration->set_seconds(seconds);
  duration->set_nanos(nanos);
}

RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull() || !yaml.IsDefined()) {
    ConfigLoader::ApplyDefaults(config);
    return config;
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

  ConfigLoader::ApplyDefaults(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* database = config.mutable_database();
  if (!database->has_sqlite() && !database->has_memory()) {
    database->mutable_sqlite()->set_path(kDefaultDatabasePath);
  }
  if (database->has_sqlite() && database->sqlite().path().empty()) {
    database->mutable_sqlite()->set_path(kDefaultDatabasePath);
  }

  auto* supervisor = config.mutable_supervisor();
  if (supervisor->default_handler().empty()) {
    supervisor->set_default_handler(kDefaultHandler);
  }
  if (supervisor->max_acquire_attempts() == 0) {
    supervisor->set_max_acquire_attempts(kDefaultAcquireAttempts);
  }
  if (supervisor->interaction_log_capacity() == 0) {
    supervisor->set_interaction_log_capacity(kDefaultInteractionLogSize);
  }
  SetDefaultDuration(supervisor->mutable_acquire_backoff(), 0, 500'000'000);

  auto* maintenance = config.mutable_maintenance();
  SetDefaultDuration(maintenance->mutable_deadline_sweep_interval(), 3600);
  SetDefaultDuration(maintenance->mutable_stuck_sweep_interval(), 3600);
  SetDefaultDuration(maintenance->mutable_recurrence_sweep_interval(), 3600);
  SetDefaultDuration(maintenance->mutable_priority_sweep_interval(), 1800);
  SetDefaultDuration(maintenance->mutable_stale_after(), 72 * 3600);
  SetDefaultDuration(maintenance->mutable_notification_window(), 24 * 3600);
}

} // namespace taskpilot::config

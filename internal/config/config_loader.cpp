#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace timekeeper::config {

using timekeeper::runtime::config::RuntimeConfig;
using timekeeper::runtime::config::StoreConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsDefined() && !yaml.IsNull()) {
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
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::ApplyEnvironmentOverrides(config);
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
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* store = config.mutable_store();
  switch (store->backend_case()) {
    case StoreConfig::BACKEND_NOT_SET:
      store->mutable_file()->set_path(kDefaultStorePath);
      break;
    case StoreConfig::kFile:
      if (store->file().path().empty()) store->mutable_file()->set_path(kDefaultStorePath);
      break;
    case StoreConfig::kSqlite:
      if (store->sqlite().path().empty()) store->mutable_sqlite()->set_path("data/storage.db");
      break;
    case StoreConfig::kMemory:
      break;
  }

  if (config.timer().update_interval_ms() == 0) {
    config.mutable_timer()->set_update_interval_ms(kDefaultUpdateIntervalMs);
  }
  if (config.timer().accuracy_threshold_seconds() == 0) {
    config.mutable_timer()->set_accuracy_threshold_seconds(kDefaultAccuracySeconds);
  }
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  const char* path = std::getenv("TIMEKEEPER_STORE_PATH");
  if (!path || *path == '\0') {
    return;
  }

  auto* store = config.mutable_store();
  switch (store->backend_case()) {
    case StoreConfig::kSqlite:
      store->mutable_sqlite()->set_path(path);
      break;
    case StoreConfig::kMemory:
      break;
    default:
      store->mutable_file()->set_path(path);
      break;
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.server().bind_address().find(':') == std::string::npos) {
    throw std::runtime_error("Invalid configuration: server.bind_address must be host:port");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && level != "trace" && level != "debug" && level != "info" && level != "warn" &&
      level != "warning" && level != "error" && level != "critical" && level != "off") {
    throw std::runtime_error("Invalid configuration: unknown logging.level '" + level + "'");
  }
}

} // namespace timekeeper::config

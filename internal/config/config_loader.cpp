#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace engram::config {

namespace {

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void ScalarToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // Quoted scalars stay strings even when they look numeric.
  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  if (!scalar.empty()) {
    char*        end    = nullptr;
    const double number = std::strtod(scalar.c_str(), &end);
    if (end && *end == '\0') {
      value->set_number_value(number);
      return;
    }
  }

  value->set_string_value(scalar);
}

void ToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      ScalarToProtoValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        ToProtoValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }
  }
}

engram::runtime::config::RuntimeConfig Parse(const YAML::Node& yaml) {
  engram::runtime::config::RuntimeConfig config;
  // An empty document means "all defaults".
  if (!yaml.IsNull() && yaml.IsDefined()) {
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level must be a mapping");
    }

    google::protobuf::Value root;
    ToProtoValue(yaml, &root);

    std::string json;
    auto        to_json = google::protobuf::util::MessageToJsonString(root, &json);
    if (!to_json.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + to_json.ToString());
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + status.ToString());
    }
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

} // namespace

engram::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

engram::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

void ConfigLoader::ApplyDefaults(engram::runtime::config::RuntimeConfig& config) {
  if (config.objects().backend_case() == engram::runtime::config::ObjectStoreConfig::BACKEND_NOT_SET) {
    config.mutable_objects()->mutable_ram();
  }
  if (config.database().backend_case() == engram::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* branches = config.mutable_branches();
  if (branches->default_branch().empty()) {
    branches->set_default_branch("main");
  }
  if (branches->default_agent().empty()) {
    branches->set_default_agent("engram");
  }

  auto* sync = config.mutable_sync();
  if (sync->default_strategy().empty()) {
    sync->set_default_strategy("intelligent_merge");
  }
  if (sync->max_stale_retries() == 0) {
    sync->set_max_stale_retries(3);
  }
}

} // namespace engram::config

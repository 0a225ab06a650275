#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace shopfloor::config {
namespace {

using shopfloor::runtime::config::RuntimeConfig;

void YamlToProtoValue(const YAML::Node& node, const std::string& path, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings ("07:00", "2026-01-01", "8")
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

std::string ChildPath(const std::string& parent, const std::string& key) {
  return parent.empty() ? key : parent + "." + key;
}

void YamlToProtoValue(const YAML::Node& node, const std::string& path, google::protobuf::Value* value) {
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
        YamlToProtoValue(node[i], path + "[" + std::to_string(i) + "]", list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (auto it : node) {
        if (!it.first.IsScalar()) {
          throw std::runtime_error("Invalid configuration: non-scalar key under '" + path + "'");
        }
        const auto key = it.first.Scalar();
        if (fields->count(key) > 0) {
          throw std::runtime_error("Invalid configuration: duplicate key '" + ChildPath(path, key) + "'");
        }
        YamlToProtoValue(it.second, ChildPath(path, key), &(*fields)[key]);
      }
      break;
    }

    default:
      throw std::runtime_error("Invalid configuration: unsupported YAML node at '" + path + "'");
  }
}

// Deployment overrides that win over the file.
void ApplyEnvironment(RuntimeConfig& config) {
  if (const char* bind = std::getenv("SHOPFLOOR_BIND_ADDRESS"); bind && *bind) {
    config.mutable_server()->set_bind_address(bind);
  }
  if (const char* path = std::getenv("SHOPFLOOR_SQLITE_PATH"); path && *path) {
    config.mutable_database()->mutable_sqlite()->set_path(path);
  }
}

RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    ApplyEnvironment(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: the document root must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, "", &json_value);

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

  ApplyEnvironment(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

} // namespace shopfloor::config

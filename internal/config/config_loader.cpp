#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace deploy::config {

namespace {

constexpr const char* kDefaultBackupType        = "FULL";
constexpr const char* kDefaultExcludedDirectory = ".Exclude";
constexpr const char* kDefaultPartialExtension  = ".py";
constexpr const char* kDefaultArchiveDirectory  = ".archive";
constexpr const char* kDefaultUser              = "admin";

std::filesystem::path StateRoot() {
  if (const char* home = std::getenv("HOME")) {
    return std::filesystem::path(home) / ".file-deploy";
  }
  return std::filesystem::temp_directory_path() / "file-deploy";
}

} // namespace

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

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

deploy::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  deploy::runtime::config::RuntimeConfig config;

  // an empty file is a valid, all-defaults configuration
  if (yaml.IsNull()) {
    ApplyDefaults(config);
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

  ApplyDefaults(config);
  return config;
}

deploy::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  deploy::runtime::config::RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(deploy::runtime::config::RuntimeConfig& config) {
  auto* backup = config.mutable_backup();
  if (backup->location().empty()) {
    backup->set_location((StateRoot() / "backups").string());
  }
  if (!backup->has_compression()) {
    backup->set_compression(true);
  }
  if (!backup->has_auto_backup()) {
    backup->set_auto_backup(true);
  }
  if (backup->default_type().empty()) {
    backup->set_default_type(kDefaultBackupType);
  }
  if (backup->excluded_directory().empty()) {
    backup->set_excluded_directory(kDefaultExcludedDirectory);
  }
  if (backup->partial_extensions().empty()) {
    backup->add_partial_extensions(kDefaultPartialExtension);
  }

  auto* deployment = config.mutable_deployment();
  if (deployment->archive_directory().empty()) {
    deployment->set_archive_directory(kDefaultArchiveDirectory);
  }
  if (deployment->default_user().empty()) {
    deployment->set_default_user(kDefaultUser);
  }
}

} // namespace deploy::config

#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace voicecode::config {

namespace {

constexpr int64_t  kDefaultUploadTimeoutSeconds   = 30;
constexpr int64_t  kDefaultConnectionTestSeconds  = 5;
constexpr uint64_t kDefaultMaxPayloadBytes        = 100ull * 1024ull * 1024ull;
constexpr double   kDefaultOrigin                 = 1.0;
constexpr double   kDefaultUnitStep               = 1.0;
constexpr double   kDefaultMinGap                 = 1e-9;
constexpr double   kDefaultRenormalizeStep        = 1.0;
constexpr const char* kDefaultStorageLocation     = "~/Downloads";

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // Quoted scalars are always strings ("30s", "0.0.0.0").
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

static voicecode::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  voicecode::runtime::config::RuntimeConfig config;

  // An empty document means "all defaults".
  if (yaml.IsNull()) {
    ConfigLoader::ApplyDefaults(&config);
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

  ConfigLoader::ApplyDefaults(&config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

voicecode::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

voicecode::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

voicecode::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  voicecode::runtime::config::RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(voicecode::runtime::config::RuntimeConfig* config) {
  if (config->database().backend_case() == voicecode::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config->mutable_database()->mutable_memory();
  }

  auto* uploads = config->mutable_uploads();
  if (!uploads->has_timeout() || (uploads->timeout().seconds() == 0 && uploads->timeout().nanos() == 0)) {
    uploads->mutable_timeout()->set_seconds(kDefaultUploadTimeoutSeconds);
  }
  if (!uploads->has_connection_test_timeout() ||
      (uploads->connection_test_timeout().seconds() == 0 && uploads->connection_test_timeout().nanos() == 0)) {
    uploads->mutable_connection_test_timeout()->set_seconds(kDefaultConnectionTestSeconds);
  }
  if (uploads->max_payload_bytes() == 0) {
    uploads->set_max_payload_bytes(kDefaultMaxPayloadBytes);
  }
  if (uploads->storage_location().empty()) {
    uploads->set_storage_location(kDefaultStorageLocation);
  }

  auto* queue = config->mutable_queue();
  if (queue->unit_step() <= 0.0) queue->set_unit_step(kDefaultUnitStep);
  if (queue->min_gap() <= 0.0) queue->set_min_gap(kDefaultMinGap);
  if (queue->renormalize_step() <= 0.0) queue->set_renormalize_step(kDefaultRenormalizeStep);
  // proto3 cannot tell an explicit 0.0 from unset; origin 0.0 reads as the default
  if (queue->origin() == 0.0) queue->set_origin(kDefaultOrigin);
}

} // namespace voicecode::config

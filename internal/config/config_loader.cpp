#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace launcher::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars stay strings so pins like "0123" and ports keep their text.
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

static launcher::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  launcher::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

launcher::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

launcher::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYamlNode(yaml);
}

namespace {

std::optional<std::string> Env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

// Accepts the spellings of strconv.ParseBool.
std::optional<bool> EnvBool(const char* name) {
  const auto value = Env(name);
  if (!value) {
    return std::nullopt;
  }
  static const std::set<std::string> kTrue  = {"1", "t", "T", "true", "TRUE", "True"};
  static const std::set<std::string> kFalse = {"0", "f", "F", "false", "FALSE", "False"};
  if (kTrue.count(*value)) {
    return true;
  }
  if (kFalse.count(*value)) {
    return false;
  }
  return std::nullopt;
}

} // namespace

void ConfigLoader::ApplyEnvironmentOverrides(launcher::runtime::config::RuntimeConfig* config) {
  auto* server     = config->mutable_server();
  auto* enrollment = config->mutable_enrollment();

  if (auto url = Env("KOLIDE_LAUNCHER_HOSTNAME"); url && !url->empty()) {
    server->set_kolide_server_url(*url);
  }
  if (auto insecure = EnvBool("KOLIDE_LAUNCHER_INSECURE")) {
    server->set_insecure_tls(*insecure);
  }
  if (auto insecure_transport = EnvBool("KOLIDE_LAUNCHER_INSECURE_TRANSPORT")) {
    server->set_insecure_transport(*insecure_transport);
  }
  if (auto secret = Env("KOLIDE_LAUNCHER_ENROLL_SECRET"); secret && !secret->empty()) {
    enrollment->set_enroll_secret(*secret);
  }
  if (auto secret_path = Env("KOLIDE_LAUNCHER_ENROLL_SECRET_PATH"); secret_path && !secret_path->empty()) {
    enrollment->set_enroll_secret_path(*secret_path);
  }
}

std::string ReadFileContents(const std::string& path, const std::string& what) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::InvalidArgument("cannot read " + what + " file: " + path);
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

} // namespace launcher::config

#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace telemetry::config {

using telemetry::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
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

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;

  // An empty document is a valid, all-defaults configuration.
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
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address("0.0.0.0:50061");
  }

  auto* broker = config.mutable_broker();
  if (broker->host().empty()) {
    broker->set_host("localhost");
  }
  if (broker->port() == 0) {
    broker->set_port(1883);
  }
  if (broker->queue_capacity() == 0) {
    broker->set_queue_capacity(1024);
  }

  auto* topics = config.mutable_topics();
  if (topics->prefix().empty()) {
    topics->set_prefix("EQ1");
  }
  if (topics->data_suffix().empty()) {
    topics->set_data_suffix("data");
  }

  auto* discovery = config.mutable_discovery();
  if (discovery->stale_after_s() == 0.0) {
    discovery->set_stale_after_s(5.0);
  }
  if (!discovery->has_drop_stale_selected()) {
    discovery->set_drop_stale_selected(true);
  }

  auto* recording = config.mutable_recording();
  if (recording->sample_hz() == 0.0) {
    recording->set_sample_hz(4.0);
  }
  if (recording->window_s() == 0.0) {
    recording->set_window_s(60.0);
  }
  if (recording->margin_samples() == 0) {
    recording->set_margin_samples(10);
  }
  if (recording->refresh_ms() == 0) {
    recording->set_refresh_ms(250);
  }

  auto* exports = config.mutable_exports();
  if (exports->csv_path().empty()) {
    exports->set_csv_path("series_export.csv");
  }

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) {
    logging->set_level("info");
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.broker().port() > 65535) {
    throw std::runtime_error("Invalid configuration: broker.port out of range");
  }
  if (config.recording().sample_hz() < 0.0) {
    throw std::runtime_error("Invalid configuration: recording.sample_hz must be positive");
  }
  if (config.recording().window_s() < 0.0) {
    throw std::runtime_error("Invalid configuration: recording.window_s must be positive");
  }
  if (config.topics().prefix().find_first_of("+#/") != std::string::npos) {
    throw std::runtime_error("Invalid configuration: topics.prefix must be a single topic level");
  }
  if (config.topics().data_suffix().find_first_of("+#/") != std::string::npos) {
    throw std::runtime_error("Invalid configuration: topics.data_suffix must be a single topic level");
  }

  for (const auto& account : config.broker().accounts()) {
    if (account.username().empty()) {
      throw std::runtime_error("Invalid configuration: broker account without username");
    }
  }
}

} // namespace telemetry::config

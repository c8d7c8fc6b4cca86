#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace glucolumin::config {

using glucolumin::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // Quoted scalars stay strings ("120/80", "0.0.0.0:50051").
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

static RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
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
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
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
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::ParseYaml(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50051");

  if (config.database().backend_case() == glucolumin::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* pipeline = config.mutable_pipeline();
  if (pipeline->workers() == 0) pipeline->set_workers(2);
  if (pipeline->min_samples() == 0) pipeline->set_min_samples(16);
  if (pipeline->max_samples_per_visit() == 0) pipeline->set_max_samples_per_visit(65536);
  if (pipeline->collection_window_ms() == 0) pipeline->set_collection_window_ms(30000);
  if (pipeline->max_processing_ms() == 0) pipeline->set_max_processing_ms(60000);
  if (pipeline->sweep_interval_ms() == 0) pipeline->set_sweep_interval_ms(500);
  if (pipeline->wavelet_levels() == 0) pipeline->set_wavelet_levels(2);
  if (pipeline->low_magnitude_threshold() == 0.0) pipeline->set_low_magnitude_threshold(10.0);
  if (pipeline->low_magnitude_gain() == 0.0) pipeline->set_low_magnitude_gain(660.0);

  auto* savgol = pipeline->mutable_savgol();
  if (savgol->window_length() == 0) savgol->set_window_length(11);
  if (savgol->poly_order() == 0) savgol->set_poly_order(3);

  auto* quality = pipeline->mutable_signal_quality();
  if (quality->min_mean() == 0.0) quality->set_min_mean(5.0);
  if (quality->max_mean() == 0.0) quality->set_max_mean(500.0);
  if (quality->min_std() == 0.0) quality->set_min_std(0.01);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto fail = [](const std::string& what) { throw std::runtime_error("Invalid configuration: " + what); };

  const auto& pipeline = config.pipeline();
  const auto  window   = pipeline.savgol().window_length();
  const auto  order    = pipeline.savgol().poly_order();

  if (window % 2 == 0) fail("pipeline.savgol.window_length must be odd");
  if (window < order + 2) fail("pipeline.savgol.window_length must be >= poly_order + 2");
  if (pipeline.min_samples() < window) fail("pipeline.min_samples must be >= pipeline.savgol.window_length");
  if (pipeline.workers() < 1) fail("pipeline.workers must be >= 1");
  if (pipeline.max_samples_per_visit() < pipeline.min_samples()) fail("pipeline.max_samples_per_visit must be >= pipeline.min_samples");
  if (pipeline.low_magnitude_gain() <= 0.0) fail("pipeline.low_magnitude_gain must be positive");

  const auto& quality = pipeline.signal_quality();
  if (quality.min_mean() >= quality.max_mean()) fail("pipeline.signal_quality.min_mean must be below max_mean");

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) fail("database.sqlite.path must be set");
}

} // namespace glucolumin::config

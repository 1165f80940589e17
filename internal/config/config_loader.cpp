#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace staging::config {

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  // quoted scalars stay strings so "0042" keeps its leading zeros
  if (node.Tag() != "!") {
    char*        endptr  = nullptr;
    const double numeric = std::strtod(text.c_str(), &endptr);
    if (!text.empty() && endptr && *endptr == '\0') {
      value->set_number_value(numeric);
      return;
    }
  }

  value->set_string_value(text);
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
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }
  }
}

staging::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  staging::runtime::config::RuntimeConfig config;
  if (!yaml.IsDefined() || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value root;
  YamlToProtoValue(yaml, &root);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

void RequireFraction(double value, const char* field) {
  if (value < 0.0 || value > 1.0) {
    throw std::runtime_error(std::string("Invalid configuration: ") + field + " must be within [0, 1]");
  }
}

void RequireNonNegative(double value, const char* field) {
  if (value < 0.0) {
    throw std::runtime_error(std::string("Invalid configuration: ") + field + " must not be negative");
  }
}

} // namespace

staging::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

staging::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

void ConfigLoader::Validate(const staging::runtime::config::RuntimeConfig& config) {
  const auto& lifecycle = config.lifecycle();
  if (lifecycle.encryption_mandatory() && !lifecycle.encryption_enabled()) {
    throw std::runtime_error("Invalid configuration: lifecycle.encryption_mandatory requires lifecycle.encryption_enabled");
  }
  for (char c : lifecycle.table_prefix()) {
    const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    if (!ok) {
      throw std::runtime_error("Invalid configuration: lifecycle.table_prefix may only hold letters, digits and '_'");
    }
  }

  const auto& analyzer = config.analyzer();
  RequireFraction(analyzer.error_rate_threshold(), "analyzer.error_rate_threshold");
  RequireNonNegative(analyzer.slow_query_threshold_ms(), "analyzer.slow_query_threshold_ms");
  RequireNonNegative(analyzer.high_memory_threshold_mb(), "analyzer.high_memory_threshold_mb");
  RequireNonNegative(analyzer.memory_ceiling_mb(), "analyzer.memory_ceiling_mb");
  RequireNonNegative(analyzer.io_ceiling_mb(), "analyzer.io_ceiling_mb");
  RequireNonNegative(analyzer.index_recommend_min_duration_ms(), "analyzer.index_recommend_min_duration_ms");
  RequireNonNegative(analyzer.compression_recommend_max_io_percent(), "analyzer.compression_recommend_max_io_percent");
  RequireNonNegative(analyzer.memory_recommend_min_percent(), "analyzer.memory_recommend_min_percent");
  RequireNonNegative(analyzer.slow_operation_threshold_ms(), "analyzer.slow_operation_threshold_ms");

  const auto start = analyzer.improvement_baseline_start_hours();
  const auto end   = analyzer.improvement_baseline_end_hours();
  if (start > 0 && end > 0 && end >= start) {
    throw std::runtime_error("Invalid configuration: analyzer.improvement_baseline_end_hours must be below improvement_baseline_start_hours");
  }

  if (config.execution().has_postgres() && config.execution().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: execution.postgres.connection_uri is required");
  }
  if (config.database().has_postgres() && config.database().postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
}

} // namespace staging::config

/**
 * @file config.cpp
 * @brief Configuration parser implementation for dnsstatd
 */

#include "config/config.h"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "config/config_schema_embedded.h"
#include "utils/error.h"
#include "utils/structured_log.h"

using nlohmann::json;
using nlohmann::json_schema::json_validator;

namespace dnsstatd::config {

namespace {

constexpr int kMaxPort = 65535;

/**
 * @brief Convert YAML node to JSON (recursive)
 *
 * @param yaml_node YAML node to convert
 * @return nlohmann::json JSON representation
 */
nlohmann::json YamlToJson(const YAML::Node& yaml_node) {
  if (yaml_node.IsNull()) {
    return nlohmann::json();
  }

  if (yaml_node.IsScalar()) {
    // Try the narrowest type first; YAML scalars carry no type tag
    int64_t int_value = 0;
    if (YAML::convert<int64_t>::decode(yaml_node, int_value)) {
      return int_value;
    }
    double double_value = 0.0;
    if (YAML::convert<double>::decode(yaml_node, double_value)) {
      return double_value;
    }
    bool bool_value = false;
    if (YAML::convert<bool>::decode(yaml_node, bool_value)) {
      return bool_value;
    }
    return yaml_node.as<std::string>();
  }

  if (yaml_node.IsSequence()) {
    nlohmann::json json_array = nlohmann::json::array();
    for (const auto& item : yaml_node) {
      json_array.push_back(YamlToJson(item));
    }
    return json_array;
  }

  if (yaml_node.IsMap()) {
    nlohmann::json json_object = nlohmann::json::object();
    for (const auto& pair : yaml_node) {
      std::string key = pair.first.as<std::string>();
      json_object[key] = YamlToJson(pair.second);
    }
    return json_object;
  }

  return nlohmann::json();
}

template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, T& target) {
  if (node[key]) {
    target = node[key].as<T>();
  }
}

void ReadList(const YAML::Node& node, const char* key, std::vector<std::string>& target) {
  if (node[key] && node[key].IsSequence()) {
    for (const auto& item : node[key]) {
      target.push_back(item.as<std::string>());
    }
  }
}

StatsConfig ParseStatsConfig(const YAML::Node& node) {
  StatsConfig config;
  ReadScalar(node, "file", config.file);
  ReadScalar(node, "interval", config.interval_days);
  ReadScalar(node, "anonymize_client_ip", config.anonymize_client_ip);
  ReadList(node, "ignored", config.ignored);
  return config;
}

ApiConfig ParseApiConfig(const YAML::Node& node) {
  ApiConfig config;
  const YAML::Node http = node["http"];
  if (http) {
    ReadScalar(http, "enable", config.http.enable);
    ReadScalar(http, "bind", config.http.bind);
    ReadScalar(http, "port", config.http.port);
    ReadScalar(http, "read_timeout_sec", config.http.read_timeout_sec);
    ReadScalar(http, "write_timeout_sec", config.http.write_timeout_sec);
    ReadScalar(http, "enable_cors", config.http.enable_cors);
    ReadScalar(http, "cors_allow_origin", config.http.cors_allow_origin);
  }
  return config;
}

NetworkConfig ParseNetworkConfig(const YAML::Node& node) {
  NetworkConfig config;
  ReadList(node, "allow_cidrs", config.allow_cidrs);
  return config;
}

LoggingConfig ParseLoggingConfig(const YAML::Node& node) {
  LoggingConfig config;
  ReadScalar(node, "level", config.level);
  ReadScalar(node, "json", config.json);
  ReadScalar(node, "file", config.file);
  return config;
}

/**
 * @brief Validate configuration against JSON Schema
 *
 * @param config_json JSON representation of configuration
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfigSchema(const nlohmann::json& config_json) {
  try {
    json schema_json = json::parse(kConfigSchemaJson);

    json_validator validator;
    validator.set_root_schema(schema_json);

    try {
      validator.validate(config_json);
      utils::StructuredLog().Event("config_validation").Field("status", "passed").Debug();
    } catch (const std::exception& e) {
      std::stringstream err_msg;
      err_msg << "Configuration validation failed:\n";
      err_msg << "  " << e.what() << "\n\n";
      err_msg << "  Common configuration issues:\n";
      err_msg << "    - Unknown keys (check spelling of section and option names)\n";
      err_msg << "    - Invalid data types (string instead of number, etc.)\n";
      err_msg << "    - Out of range values (check min/max constraints)";
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError, err_msg.str()));
    }
  } catch (const json::parse_error& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, std::string("JSON parse error: ") + e.what()));
  }

  return {};
}

}  // namespace

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    YAML::Node root = YAML::LoadFile(path);

    // An empty file is a valid configuration with all defaults
    if (root.IsNull()) {
      return Config{};
    }

    nlohmann::json config_json = YamlToJson(root);

    auto validation_result = ValidateConfigSchema(config_json);
    if (!validation_result) {
      return utils::MakeUnexpected(validation_result.error());
    }

    Config config;

    if (root["stats"]) {
      config.stats = ParseStatsConfig(root["stats"]);
    }
    if (root["api"]) {
      config.api = ParseApiConfig(root["api"]);
    }
    if (root["network"]) {
      config.network = ParseNetworkConfig(root["network"]);
    }
    if (root["logging"]) {
      config.logging = ParseLoggingConfig(root["logging"]);
    }

    auto semantic_validation = ValidateConfig(config);
    if (!semantic_validation) {
      return utils::MakeUnexpected(semantic_validation.error());
    }

    return config;

  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigFileNotFound, "Failed to open config file: " + std::string(e.what())));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what())));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what())));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  if (config.stats.file.empty()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "stats.file must not be empty"));
  }

  for (const auto& host : config.stats.ignored) {
    if (host.empty()) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "stats.ignored must not contain empty entries"));
    }
  }

  if (config.api.http.enable && (config.api.http.port <= 0 || config.api.http.port > kMaxPort)) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "api.http.port must be between 1 and 65535"));
  }
  if (config.api.http.read_timeout_sec <= 0 || config.api.http.write_timeout_sec <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "api.http timeouts must be greater than 0"));
  }

  if (config.logging.level != "trace" && config.logging.level != "debug" && config.logging.level != "info" &&
      config.logging.level != "warn" && config.logging.level != "error") {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "logging.level must be one of: trace, debug, info, warn, error (got: " + config.logging.level + ")"));
  }

  return {};
}

std::string ConfigToYaml(const Config& config) {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "stats" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "file" << YAML::Value << config.stats.file;
  out << YAML::Key << "interval" << YAML::Value << config.stats.interval_days;
  out << YAML::Key << "anonymize_client_ip" << YAML::Value << config.stats.anonymize_client_ip;
  out << YAML::Key << "ignored" << YAML::Value << YAML::BeginSeq;
  for (const auto& host : config.stats.ignored) {
    out << host;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;

  out << YAML::Key << "api" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "http" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "enable" << YAML::Value << config.api.http.enable;
  out << YAML::Key << "bind" << YAML::Value << config.api.http.bind;
  out << YAML::Key << "port" << YAML::Value << config.api.http.port;
  out << YAML::Key << "read_timeout_sec" << YAML::Value << config.api.http.read_timeout_sec;
  out << YAML::Key << "write_timeout_sec" << YAML::Value << config.api.http.write_timeout_sec;
  out << YAML::Key << "enable_cors" << YAML::Value << config.api.http.enable_cors;
  out << YAML::Key << "cors_allow_origin" << YAML::Value << config.api.http.cors_allow_origin;
  out << YAML::EndMap;
  out << YAML::EndMap;

  out << YAML::Key << "network" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "allow_cidrs" << YAML::Value << YAML::BeginSeq;
  for (const auto& cidr : config.network.allow_cidrs) {
    out << cidr;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;

  out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "level" << YAML::Value << config.logging.level;
  out << YAML::Key << "json" << YAML::Value << config.logging.json;
  out << YAML::Key << "file" << YAML::Value << config.logging.file;
  out << YAML::EndMap;

  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

}  // namespace dnsstatd::config

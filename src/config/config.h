/**
 * @file config.h
 * @brief Configuration structures and YAML parser for dnsstatd
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace dnsstatd::config {

// Default values for configuration
namespace defaults {

// Statistics defaults
constexpr uint32_t kStatsIntervalDays = 1;
constexpr const char* kStatsFile = "data/stats.db";

// API defaults
constexpr int kHttpPort = 8080;
constexpr int kHttpReadTimeoutSec = 5;
constexpr int kHttpWriteTimeoutSec = 5;

}  // namespace defaults

/**
 * @brief Statistics engine configuration
 */
struct StatsConfig {
  std::string file = defaults::kStatsFile;                 ///< Bucket store path
  uint32_t interval_days = defaults::kStatsIntervalDays;  ///< Retention in days: 0, 1, 7, 30 or 90
  bool anonymize_client_ip = false;                       ///< Mask client IPs before counting
  std::vector<std::string> ignored;                       ///< Domains that are never counted
};

/**
 * @brief API configuration
 */
struct ApiConfig {
  struct {
    bool enable = false;  // Disabled by default
    std::string bind = "127.0.0.1";
    int port = defaults::kHttpPort;
    int read_timeout_sec = defaults::kHttpReadTimeoutSec;
    int write_timeout_sec = defaults::kHttpWriteTimeoutSec;
    bool enable_cors = false;
    std::string cors_allow_origin;
  } http;
};

/**
 * @brief Network security configuration
 */
struct NetworkConfig {
  std::vector<std::string> allow_cidrs;  ///< Allowed CIDR ranges (empty = deny all)
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";  ///< Log level: trace, debug, info, warn, error
  bool json = true;            ///< Use structured JSON logging
  std::string file;            ///< Log file path (empty = stdout)
};

/**
 * @brief Root configuration
 */
struct Config {
  StatsConfig stats;      ///< Statistics engine configuration
  ApiConfig api;          ///< API configuration
  NetworkConfig network;  ///< Network security configuration
  LoggingConfig logging;  ///< Logging configuration
};

/**
 * @brief Load configuration from YAML file
 *
 * The document is checked against the embedded JSON Schema first, then
 * parsed and validated semantically.
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Validate configuration
 *
 * A stats.interval outside the supported set is not an error here: the
 * engine falls back to one day for legacy files.
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

/**
 * @brief Serialize configuration back to YAML
 *
 * Used to persist settings changed at runtime (e.g. stats retention).
 *
 * @param config Configuration to serialize
 * @return YAML document text
 */
std::string ConfigToYaml(const Config& config);

}  // namespace dnsstatd::config

/**
 * @file main.cpp
 * @brief Entry point for the dnsstatd daemon
 */

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "config/config.h"
#include "server/http_server.h"
#include "stats/entry.h"
#include "stats/report.h"
#include "stats/stats_engine.h"
#include "utils/structured_log.h"
#include "version.h"

namespace {
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile std::sig_atomic_t g_shutdown_requested = 0;

constexpr int kShutdownPollIntervalMs = 100;  // Main loop poll interval
constexpr size_t kEntryFieldCount = 4;

/**
 * @brief Signal handler for graceful shutdown
 * @param signal Signal number
 *
 * This handler is async-signal-safe: it only sets an atomic flag.
 */
void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested = 1;
  }
}

/**
 * @brief Configure spdlog and the structured log format
 * @return false if the log file cannot be opened
 */
bool SetupLogging(const dnsstatd::config::LoggingConfig& logging) {
  if (!logging.file.empty()) {
    try {
      auto file_logger = spdlog::basic_logger_mt("dnsstatd", logging.file);
      spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& e) {
      std::cerr << "Error: Failed to open log file " << logging.file << ": " << e.what() << "\n";
      return false;
    }
  }

  spdlog::set_level(spdlog::level::from_str(logging.level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::flush_on(spdlog::level::warn);

  dnsstatd::utils::StructuredLog::SetFormat(logging.json ? dnsstatd::utils::LogFormat::JSON
                                                         : dnsstatd::utils::LogFormat::TEXT);
  return true;
}

/**
 * @brief Parse "client\tdomain\tresult\telapsed_us"
 */
std::optional<dnsstatd::stats::Entry> ParseEntryLine(const std::string& line) {
  std::vector<std::string> fields;
  std::istringstream stream(line);
  std::string field;
  while (std::getline(stream, field, '\t')) {
    fields.push_back(field);
  }
  if (fields.size() != kEntryFieldCount) {
    return std::nullopt;
  }

  auto result = dnsstatd::stats::ParseResult(fields[2]);
  if (!result) {
    return std::nullopt;
  }

  dnsstatd::stats::Entry entry;
  entry.client = fields[0];
  entry.domain = fields[1];
  entry.result = *result;
  try {
    size_t consumed = 0;
    unsigned long elapsed = std::stoul(fields[3], &consumed);  // NOLINT(google-runtime-int)
    if (consumed != fields[3].size() || elapsed > UINT32_MAX) {
      return std::nullopt;
    }
    entry.processing_time_us = static_cast<uint32_t>(elapsed);
  } catch (const std::exception&) {
    return std::nullopt;
  }
  return entry;
}

/**
 * @brief Feed entries from stdin until EOF or a shutdown signal
 */
void IngestStdin(dnsstatd::stats::StatsEngine& engine) {
  std::string line;
  uint64_t accepted = 0;
  uint64_t rejected = 0;
  while (g_shutdown_requested == 0 && std::getline(std::cin, line)) {
    if (line.empty()) {
      continue;
    }
    auto entry = ParseEntryLine(line);
    if (!entry) {
      ++rejected;
      spdlog::debug("Skipping malformed input line: {}", line);
      continue;
    }
    if (!engine.ShouldCount(entry->domain)) {
      continue;
    }
    engine.Update(*entry);
    ++accepted;
  }
  spdlog::info("Input finished: accepted={} rejected={}", accepted, rejected);
}

/**
 * @brief Write the effective configuration back to path
 */
void SaveConfig(const std::string& path, dnsstatd::config::Config config, const dnsstatd::stats::StatsEngine& engine) {
  config.stats = engine.GetConfig();
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    spdlog::error("Failed to write configuration to {}", path);
    return;
  }
  out << dnsstatd::config::ConfigToYaml(config);
  if (!out) {
    spdlog::error("Failed to write configuration to {}", path);
    return;
  }
  spdlog::info("Configuration saved to {}", path);
}

}  // namespace

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit code
 */
int main(int argc, char* argv[]) {
  // Setup signal handlers
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  // Parse command line arguments
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  bool config_test_mode = false;
  bool report_mode = false;
  bool stdin_mode = false;
  const char* config_path = nullptr;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      std::cout << "Usage: " << argv[0] << " [OPTIONS] [<config.yaml>]\n";
      std::cout << "       " << argv[0] << " -c <config.yaml> [OPTIONS]\n";
      std::cout << "\n";
      std::cout << "Options:\n";
      std::cout << "  -c, --config <file>            Configuration file path\n";
      std::cout << "  -t, --config-test              Test configuration file and exit\n";
      std::cout << "      --stdin                    Count entries read from stdin until EOF\n";
      std::cout << "                                 (client<TAB>domain<TAB>result<TAB>elapsed_us)\n";
      std::cout << "      --report                   Print the statistics report as JSON and exit\n";
      std::cout << "  -h, --help                     Show this help message\n";
      std::cout << "  -v, --version                  Show version information\n";
      std::cout << "\n";
      std::cout << "Example:\n";
      std::cout << "  " << argv[0] << " -c /etc/dnsstatd/config.yaml\n";
      std::cout << "  query-log | " << argv[0] << " -c examples/config.yaml --stdin\n";
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      std::cout << "dnsstatd version " << dnsstatd::Version::String() << "\n";
      std::cout << "Round-robin DNS query statistics\n";
      return 0;
    }
    if (arg == "-t" || arg == "--config-test") {
      config_test_mode = true;
    } else if (arg == "--report") {
      report_mode = true;
    } else if (arg == "--stdin") {
      stdin_mode = true;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      } else {
        std::cerr << "Error: " << arg << " requires a file path\n";
        return 1;
      }
    } else if (arg[0] != '-') {
      // Positional argument: config file path
      if (config_path == nullptr) {
        config_path = argv[i];
      } else {
        std::cerr << "Error: Multiple config files specified\n";
        return 1;
      }
    } else {
      std::cerr << "Error: Unknown option: " << arg << "\n";
      std::cerr << "Use -h or --help for usage information\n";
      return 1;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  // Load configuration
  dnsstatd::config::Config config;
  if (config_path != nullptr) {
    auto config_result = dnsstatd::config::LoadConfig(config_path);
    if (!config_result) {
      spdlog::error("Failed to load config: {}", config_result.error().to_string());
      return 1;
    }
    config = *config_result;

    // Config test mode: validate and exit
    if (config_test_mode) {
      std::cout << "Configuration file is valid\n";
      std::cout << "\nConfiguration summary:\n";
      std::cout << "  Stats:\n";
      std::cout << "    file: " << config.stats.file << "\n";
      std::cout << "    interval: " << config.stats.interval_days << "\n";
      std::cout << "    anonymize_client_ip: " << (config.stats.anonymize_client_ip ? "true" : "false") << "\n";
      std::cout << "    ignored: " << config.stats.ignored.size() << " rule(s)\n";
      std::cout << "  API:\n";
      std::cout << "    http.enable: " << (config.api.http.enable ? "true" : "false") << "\n";
      std::cout << "    http.bind: " << config.api.http.bind << "\n";
      std::cout << "    http.port: " << config.api.http.port << "\n";
      std::cout << "  Network:\n";
      std::cout << "    allow_cidrs: " << config.network.allow_cidrs.size() << " range(s)\n";
      std::cout << "  Logging:\n";
      std::cout << "    level: " << config.logging.level << "\n";
      return 0;
    }
  } else if (config_test_mode) {
    std::cerr << "Error: --config-test requires a configuration file\n";
    return 1;
  }

  if (!SetupLogging(config.logging)) {
    return 1;
  }

  spdlog::info("dnsstatd {} starting...", dnsstatd::Version::String());
  if (config_path != nullptr) {
    spdlog::info("Configuration loaded from: {}", config_path);
  } else {
    spdlog::info("No configuration file specified, using defaults");
  }

  std::unique_ptr<dnsstatd::server::HttpServer> http_server;
  if (config.api.http.enable && !report_mode) {
    dnsstatd::server::HttpServerConfig http_config;
    http_config.bind = config.api.http.bind;
    http_config.port = config.api.http.port;
    http_config.read_timeout_sec = config.api.http.read_timeout_sec;
    http_config.write_timeout_sec = config.api.http.write_timeout_sec;
    http_config.enable_cors = config.api.http.enable_cors;
    http_config.cors_allow_origin = config.api.http.cors_allow_origin;
    http_config.allow_cidrs = config.network.allow_cidrs;
    if (http_config.allow_cidrs.empty()) {
      spdlog::warn("network.allow_cidrs is empty: all HTTP requests will be rejected");
    }
    http_server = std::make_unique<dnsstatd::server::HttpServer>(std::move(http_config));
  }

  std::unique_ptr<dnsstatd::stats::StatsEngine> engine;

  dnsstatd::stats::EngineOptions options;
  options.config = config.stats;
  options.registrar = http_server.get();
  if (config_path != nullptr) {
    std::string path = config_path;
    options.config_modified = [path, config, &engine]() {
      if (engine) {
        SaveConfig(path, config, *engine);
      }
    };
  }

  auto engine_result = dnsstatd::stats::StatsEngine::Create(std::move(options));
  if (!engine_result) {
    spdlog::error("Failed to initialize statistics: {}", engine_result.error().to_string());
    return 1;
  }
  engine = std::move(*engine_result);

  if (report_mode) {
    auto report = engine->GetReport();
    if (!report) {
      spdlog::error("Failed to build report: {}", report.error().to_string());
      return 1;
    }
    std::cout << dnsstatd::stats::ReportToJson(*report).dump(2) << "\n";
    auto closed = engine->Shutdown();
    if (!closed) {
      spdlog::error("Failed to close statistics: {}", closed.error().to_string());
      return 1;
    }
    return 0;
  }

  engine->Start();

  if (http_server) {
    auto start_result = http_server->Start();
    if (!start_result) {
      spdlog::error("Failed to start HTTP server: {}", start_result.error().to_string());
      auto closed = engine->Shutdown();
      if (!closed) {
        spdlog::error("Failed to close statistics: {}", closed.error().to_string());
      }
      return 1;
    }
  }

  if (stdin_mode) {
    IngestStdin(*engine);
  } else {
    spdlog::info("Server is running. Press Ctrl+C to stop.");
    while (g_shutdown_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(kShutdownPollIntervalMs));
    }
    spdlog::info("Shutdown signal received");
  }

  if (http_server) {
    http_server->Stop();
  }

  auto closed = engine->Shutdown();
  if (!closed) {
    spdlog::error("Failed to close statistics: {}", closed.error().to_string());
    return 1;
  }

  spdlog::info("dnsstatd stopped gracefully");
  return 0;
}

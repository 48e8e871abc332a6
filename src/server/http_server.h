/**
 * @file http_server.h
 * @brief HTTP server for the JSON control API
 */

#pragma once

// Fix for httplib missing NI_MAXHOST on some platforms
#ifndef NI_MAXHOST
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define NI_MAXHOST 1025
#endif

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "stats/route_registrar.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/network_utils.h"

namespace dnsstatd::server {

/**
 * @brief HTTP server configuration
 */
struct HttpServerConfig {
  std::string bind = "127.0.0.1";
  int port = 8080;
  int read_timeout_sec = 5;
  int write_timeout_sec = 5;
  bool enable_cors = false;
  std::string cors_allow_origin;
  std::vector<std::string> allow_cidrs;  // IPv4 or IPv6 ranges; empty denies everything
};

/**
 * @brief HTTP server for the JSON control API
 *
 * Serves GET /health itself; everything else is registered through the
 * stats::RouteRegistrar interface before Start(). Requests from addresses
 * outside allow_cidrs get 403.
 */
class HttpServer : public stats::RouteRegistrar {
 public:
  explicit HttpServer(HttpServerConfig config);

  ~HttpServer() override;

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  void RegisterRoute(stats::HttpMethod method, const std::string& path, stats::RouteHandler handler) override;

  /**
   * @brief Bind and serve on a background thread
   * @return kNetworkAlreadyRunning, or kNetworkBindFailed when the address is unavailable
   */
  utils::Expected<void, utils::Error> Start();

  /**
   * @brief Stop serving and join the server thread (idempotent)
   */
  void Stop();

  bool IsRunning() const { return running_; }

  int GetPort() const { return config_.port; }

  /**
   * @brief Requests dispatched to registered routes
   */
  uint64_t GetTotalRequests() const { return total_requests_.load(); }

 private:
  void EnableCors();

  HttpServerConfig config_;
  std::vector<utils::CIDR> parsed_allow_cidrs_;
  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> total_requests_{0};
};

}  // namespace dnsstatd::server

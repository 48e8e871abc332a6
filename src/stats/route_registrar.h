/**
 * @file route_registrar.h
 * @brief Seam between the statistics engine and an HTTP front end
 *
 * The engine registers its JSON endpoints through this interface on Start().
 * Any HTTP library can implement it; server::HttpServer does so with
 * cpp-httplib.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace dnsstatd::stats {

/**
 * @brief HTTP method of a route
 */
enum class HttpMethod : std::uint8_t { kGet, kPost };

/**
 * @brief Library-independent view of an HTTP request
 */
struct ApiRequest {
  std::string body;
  std::map<std::string, std::string> params;  ///< Query string parameters
  std::string remote_addr;
};

/**
 * @brief Library-independent HTTP response
 */
struct ApiResponse {
  int status = 200;    // NOLINT(readability-magic-numbers)
  nlohmann::json body;  ///< Serialized as JSON; null sends an empty body
};

using RouteHandler = std::function<ApiResponse(const ApiRequest&)>;

/**
 * @brief Receiver of route registrations
 */
class RouteRegistrar {
 public:
  virtual ~RouteRegistrar() = default;

  /**
   * @brief Register a handler for method and path
   */
  virtual void RegisterRoute(HttpMethod method, const std::string& path, RouteHandler handler) = 0;
};

}  // namespace dnsstatd::stats

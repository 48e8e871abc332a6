/**
 * @file stats_http.cpp
 * @brief Statistics control endpoints
 */

#include "stats/stats_http.h"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include "stats/report.h"
#include "stats/stats_engine.h"
#include "stats/unit_id.h"
#include "utils/structured_log.h"

using json = nlohmann::json;

namespace dnsstatd::stats {

namespace {

constexpr int kHttpOk = 200;
constexpr int kHttpBadRequest = 400;
constexpr int kHttpInternalServerError = 500;

constexpr size_t kDefaultTopClients = 10;
constexpr size_t kMaxTopClients = 1000;

ApiResponse MakeErrorResponse(int status, const std::string& message) {
  ApiResponse response;
  response.status = status;
  response.body = json{{"error", message}};
  return response;
}

ApiResponse MakeOkResponse(json body = json{{"status", "ok"}}) {
  ApiResponse response;
  response.status = kHttpOk;
  response.body = std::move(body);
  return response;
}

}  // namespace

ApiResponse HandleGetStats(StatsEngine& engine, const ApiRequest& req) {
  auto report = engine.GetReport();
  if (!report) {
    utils::LogHttpRequestError("/control/stats", req.remote_addr, report.error().to_string());
    return MakeErrorResponse(kHttpInternalServerError, "Couldn't get statistics: " + report.error().message());
  }
  return MakeOkResponse(ReportToJson(*report));
}

ApiResponse HandleStatsReset(StatsEngine& engine, const ApiRequest& req) {
  auto result = engine.Reset();
  if (!result) {
    utils::LogHttpRequestError("/control/stats_reset", req.remote_addr, result.error().to_string());
    return MakeErrorResponse(kHttpInternalServerError, "Couldn't reset statistics: " + result.error().message());
  }
  return MakeOkResponse();
}

ApiResponse HandleStatsInfo(StatsEngine& engine, const ApiRequest& /*req*/) {
  return MakeOkResponse(json{{"interval", engine.GetRetentionDays()}});
}

ApiResponse HandleStatsConfig(StatsEngine& engine, const ApiRequest& req) {
  uint32_t days = 0;
  try {
    json body = json::parse(req.body);
    if (!body.is_object() || !body.contains("interval") || !body["interval"].is_number_unsigned()) {
      return MakeErrorResponse(kHttpBadRequest, "Field 'interval' must be a non-negative integer");
    }
    auto value = body["interval"].get<uint64_t>();
    if (value > std::numeric_limits<uint32_t>::max()) {
      return MakeErrorResponse(kHttpBadRequest, "Unsupported interval: " + std::to_string(value));
    }
    days = static_cast<uint32_t>(value);
  } catch (const json::exception& e) {
    return MakeErrorResponse(kHttpBadRequest, "Invalid JSON: " + std::string(e.what()));
  }

  if (!CheckInterval(days)) {
    return MakeErrorResponse(kHttpBadRequest, "Unsupported interval: " + std::to_string(days));
  }

  auto result = engine.SetRetention(days);
  if (!result) {
    utils::LogHttpRequestError("/control/stats_config", req.remote_addr, result.error().to_string());
    return MakeErrorResponse(kHttpInternalServerError, result.error().message());
  }

  engine.NotifyConfigModified();
  return MakeOkResponse();
}

ApiResponse HandleTopClients(StatsEngine& engine, const ApiRequest& req) {
  size_t limit = kDefaultTopClients;
  auto param = req.params.find("limit");
  if (param != req.params.end()) {
    try {
      size_t consumed = 0;
      unsigned long value = std::stoul(param->second, &consumed);  // NOLINT(google-runtime-int)
      if (consumed != param->second.size() || value == 0 || value > kMaxTopClients) {
        return MakeErrorResponse(kHttpBadRequest, "Parameter 'limit' must be between 1 and 1000");
      }
      limit = static_cast<size_t>(value);
    } catch (const std::exception&) {
      return MakeErrorResponse(kHttpBadRequest, "Parameter 'limit' must be between 1 and 1000");
    }
  }

  auto clients = engine.TopClients(limit);
  if (!clients) {
    utils::LogHttpRequestError("/control/stats/top_clients", req.remote_addr, clients.error().to_string());
    return MakeErrorResponse(kHttpInternalServerError, "Couldn't get top clients: " + clients.error().message());
  }

  json list = json::array();
  for (const auto& address : *clients) {
    list.push_back(address.ToString());
  }
  return MakeOkResponse(json{{"clients", list}});
}

void RegisterStatsRoutes(RouteRegistrar& registrar, StatsEngine& engine) {
  StatsEngine* target = &engine;
  registrar.RegisterRoute(HttpMethod::kGet, "/control/stats",
                          [target](const ApiRequest& req) { return HandleGetStats(*target, req); });
  registrar.RegisterRoute(HttpMethod::kPost, "/control/stats_reset",
                          [target](const ApiRequest& req) { return HandleStatsReset(*target, req); });
  registrar.RegisterRoute(HttpMethod::kGet, "/control/stats_info",
                          [target](const ApiRequest& req) { return HandleStatsInfo(*target, req); });
  registrar.RegisterRoute(HttpMethod::kPost, "/control/stats_config",
                          [target](const ApiRequest& req) { return HandleStatsConfig(*target, req); });
  registrar.RegisterRoute(HttpMethod::kGet, "/control/stats/top_clients",
                          [target](const ApiRequest& req) { return HandleTopClients(*target, req); });
  spdlog::debug("Statistics routes registered");
}

}  // namespace dnsstatd::stats

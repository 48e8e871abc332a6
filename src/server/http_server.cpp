/**
 * @file http_server.cpp
 * @brief HTTP server for the JSON control API
 */

#include "server/http_server.h"

#include <spdlog/spdlog.h>

#include <chrono>

#include "utils/structured_log.h"

using json = nlohmann::json;

namespace dnsstatd::server {

namespace {

constexpr int kHttpOk = 200;
constexpr int kHttpNoContent = 204;
constexpr int kHttpForbidden = 403;
constexpr int kHttpInternalServerError = 500;

stats::ApiRequest ToApiRequest(const httplib::Request& req) {
  stats::ApiRequest api_req;
  api_req.body = req.body;
  api_req.remote_addr = req.remote_addr;
  for (const auto& [key, value] : req.params) {
    api_req.params.emplace(key, value);  // First value wins
  }
  return api_req;
}

void SendJson(httplib::Response& res, int status_code, const json& body) {
  res.status = status_code;
  res.set_content(body.dump(), "application/json");
}

void SendError(httplib::Response& res, int status_code, const std::string& message) {
  SendJson(res, status_code, json{{"error", message}});
}

}  // namespace

HttpServer::HttpServer(HttpServerConfig config)
    : config_(std::move(config)),
      parsed_allow_cidrs_(utils::ParseAllowCidrs(config_.allow_cidrs)),
      server_(std::make_unique<httplib::Server>()) {
  server_->set_read_timeout(config_.read_timeout_sec, 0);
  server_->set_write_timeout(config_.write_timeout_sec, 0);

  // The ACL runs before routing, so it covers every route registered later
  server_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
    if (utils::IsIPAllowed(req.remote_addr, parsed_allow_cidrs_)) {
      return httplib::Server::HandlerResponse::Unhandled;
    }
    utils::LogHttpRequestError(req.path, req.remote_addr.empty() ? "<unknown>" : req.remote_addr,
                               "rejected by allow_cidrs");
    SendError(res, kHttpForbidden, "Access denied by network.allow_cidrs");
    return httplib::Server::HandlerResponse::Handled;
  });

  server_->Get("/health", [](const httplib::Request& /*req*/, httplib::Response& res) {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch());
    SendJson(res, kHttpOk, json{{"status", "ok"}, {"timestamp", now.count()}});
  });

  if (config_.enable_cors) {
    EnableCors();
  }
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::RegisterRoute(stats::HttpMethod method, const std::string& path, stats::RouteHandler handler) {
  auto wrapped = [this, path, handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
    total_requests_.fetch_add(1);
    try {
      stats::ApiResponse response = handler(ToApiRequest(req));
      if (response.body.is_null()) {
        res.status = response.status;
        return;
      }
      SendJson(res, response.status, response.body);
    } catch (const std::exception& e) {
      utils::LogHttpRequestError(path, req.remote_addr, e.what());
      SendError(res, kHttpInternalServerError, "Internal error: " + std::string(e.what()));
    }
  };

  switch (method) {
    case stats::HttpMethod::kGet:
      server_->Get(path, wrapped);
      break;
    case stats::HttpMethod::kPost:
      server_->Post(path, wrapped);
      break;
  }
  spdlog::debug("HTTP route registered: {}", path);
}

void HttpServer::EnableCors() {
  const std::string allow_origin = config_.cors_allow_origin.empty() ? "null" : config_.cors_allow_origin;

  server_->Options(".*", [allow_origin](const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", allow_origin);
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
    res.status = kHttpNoContent;
  });

  server_->set_post_routing_handler([allow_origin](const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", allow_origin);
  });
}

utils::Expected<void, utils::Error> HttpServer::Start() {
  if (running_.exchange(true)) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kNetworkAlreadyRunning, "HTTP server already running"));
  }

  // Bind here so that failures are reported to the caller
  if (!server_->bind_to_port(config_.bind, config_.port)) {
    running_ = false;
    auto error = utils::MakeError(utils::ErrorCode::kNetworkBindFailed,
                                  "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port));
    utils::StructuredLog()
        .Event("server_error")
        .Field("operation", "http_server_bind")
        .Field("bind", config_.bind)
        .Field("port", static_cast<uint64_t>(config_.port))
        .Field("error", error.to_string())
        .Error();
    return utils::MakeUnexpected(error);
  }

  server_thread_ = std::thread([this]() {
    if (!server_->listen_after_bind()) {
      utils::StructuredLog().Event("server_error").Field("operation", "http_server_listen").Error();
    }
  });
  // stop() is ignored until the listen loop is entered
  server_->wait_until_ready();

  spdlog::info("HTTP server listening on {}:{}", config_.bind, config_.port);
  return {};
}

void HttpServer::Stop() {
  if (running_.exchange(false)) {
    spdlog::info("Stopping HTTP server...");
    server_->stop();
  }
  if (server_thread_.joinable()) {
    server_thread_.join();
    spdlog::info("HTTP server stopped");
  }
}

}  // namespace dnsstatd::server

/**
 * @file http_server_test.cpp
 * @brief Unit tests for HTTP server
 *
 * Tests:
 * - Health endpoint
 * - Registered route dispatch
 * - Network ACL
 * - CORS headers
 * - Statistics endpoints end to end
 */

#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <thread>

#include "server/http_server.h"
#include "stats/stats_engine.h"

using json = nlohmann::json;
using namespace dnsstatd;

namespace {

std::unique_ptr<server::HttpServer> StartServer(server::HttpServerConfig config,
                                                const std::function<void(server::HttpServer&)>& register_routes = {}) {
  auto http_server = std::make_unique<server::HttpServer>(std::move(config));
  if (register_routes) {
    register_routes(*http_server);
  }
  auto result = http_server->Start();
  EXPECT_TRUE(result) << "Failed to start HTTP server: " << result.error().message();
  return http_server;
}

class HttpServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server::HttpServerConfig http_config;
    http_config.bind = "127.0.0.1";
    http_config.port = 18091;
    http_config.allow_cidrs = {"127.0.0.0/8"};

    http_server_ = StartServer(http_config, [](server::HttpServer& srv) {
      srv.RegisterRoute(stats::HttpMethod::kGet, "/echo", [](const stats::ApiRequest& req) {
        stats::ApiResponse response;
        response.body = json{{"params", req.params}, {"remote", req.remote_addr}};
        return response;
      });
      srv.RegisterRoute(stats::HttpMethod::kPost, "/echo", [](const stats::ApiRequest& req) {
        stats::ApiResponse response;
        response.status = 201;
        response.body = json{{"body", req.body}};
        return response;
      });
      srv.RegisterRoute(stats::HttpMethod::kGet, "/throws",
                        [](const stats::ApiRequest&) -> stats::ApiResponse { throw std::runtime_error("boom"); });
      srv.RegisterRoute(stats::HttpMethod::kPost, "/empty", [](const stats::ApiRequest&) {
        stats::ApiResponse response;
        response.status = 204;
        return response;
      });
    });

    client_ = std::make_unique<httplib::Client>("http://127.0.0.1:18091");
  }

  void TearDown() override {
    client_.reset();
    if (http_server_) {
      http_server_->Stop();
    }
  }

  std::unique_ptr<server::HttpServer> http_server_;
  std::unique_ptr<httplib::Client> client_;
};

}  // namespace

// ============================================================================
// Built-in routes and dispatch
// ============================================================================

TEST_F(HttpServerTest, Health) {
  auto res = client_->Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);

  auto body = json::parse(res->body);
  EXPECT_EQ(body["status"], "ok");
  EXPECT_TRUE(body.contains("timestamp"));
}

TEST_F(HttpServerTest, DispatchesGetWithParams) {
  auto res = client_->Get("/echo?limit=5&limit=7&name=x");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");

  auto body = json::parse(res->body);
  EXPECT_EQ(body["params"]["limit"], "5");
  EXPECT_EQ(body["params"]["name"], "x");
  EXPECT_EQ(body["remote"], "127.0.0.1");
  EXPECT_EQ(http_server_->GetTotalRequests(), 1U);
}

TEST_F(HttpServerTest, DispatchesPostBody) {
  auto res = client_->Post("/echo", R"({"a":1})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 201);
  EXPECT_EQ(json::parse(res->body)["body"], R"({"a":1})");
}

TEST_F(HttpServerTest, HandlerExceptionIsInternalError) {
  auto res = client_->Get("/throws");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  EXPECT_TRUE(json::parse(res->body).contains("error"));
}

TEST_F(HttpServerTest, NullBodySendsStatusOnly) {
  auto res = client_->Post("/empty", "", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 204);
  EXPECT_TRUE(res->body.empty());
}

TEST_F(HttpServerTest, UnknownRouteIsNotFound) {
  auto res = client_->Get("/control/unknown");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(HttpServerTest, StartTwiceFails) {
  EXPECT_TRUE(http_server_->IsRunning());
  auto result = http_server_->Start();
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kNetworkAlreadyRunning);
}

TEST(HttpServerLifecycleTest, StopWithoutStart) {
  server::HttpServer http_server(server::HttpServerConfig{});
  http_server.Stop();
  EXPECT_FALSE(http_server.IsRunning());
}

// ============================================================================
// Access control
// ============================================================================

TEST(HttpServerAclTest, EmptyAllowListDeniesEverything) {
  server::HttpServerConfig config;
  config.port = 18092;
  auto http_server = StartServer(config);

  httplib::Client client("http://127.0.0.1:18092");
  auto res = client.Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 403);
  EXPECT_TRUE(json::parse(res->body).contains("error"));

  http_server->Stop();
}

TEST(HttpServerAclTest, AddressOutsideAllowListDenied) {
  server::HttpServerConfig config;
  config.port = 18093;
  config.allow_cidrs = {"10.0.0.0/8"};
  auto http_server = StartServer(config);

  httplib::Client client("http://127.0.0.1:18093");
  auto res = client.Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 403);

  http_server->Stop();
}

// ============================================================================
// CORS
// ============================================================================

TEST(HttpServerCorsTest, AddsHeadersWhenEnabled) {
  server::HttpServerConfig config;
  config.port = 18094;
  config.allow_cidrs = {"127.0.0.1/32"};
  config.enable_cors = true;
  config.cors_allow_origin = "http://localhost:3000";
  auto http_server = StartServer(config);

  httplib::Client client("http://127.0.0.1:18094");
  auto res = client.Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "http://localhost:3000");

  auto preflight = client.Options("/control/stats");
  ASSERT_TRUE(preflight);
  EXPECT_EQ(preflight->status, 204);
  EXPECT_EQ(preflight->get_header_value("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");

  http_server->Stop();
}

// ============================================================================
// Statistics endpoints over HTTP
// ============================================================================

TEST(HttpServerStatsTest, EngineRoutesServed) {
  auto dir = std::filesystem::temp_directory_path() / "dnsstatd_http_server_stats_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  server::HttpServerConfig config;
  config.port = 18095;
  config.allow_cidrs = {"127.0.0.0/8"};
  auto http_server = std::make_unique<server::HttpServer>(config);

  std::atomic<int> config_writes{0};
  stats::EngineOptions options;
  options.config.file = (dir / "stats.db").string();
  options.config.interval_days = 1;
  options.registrar = http_server.get();
  options.config_modified = [&config_writes]() { ++config_writes; };
  auto engine = stats::StatsEngine::Create(std::move(options));
  ASSERT_TRUE(engine.has_value()) << engine.error().to_string();

  (*engine)->Start();
  ASSERT_TRUE(http_server->Start());

  (*engine)->Update(stats::Entry{"127.0.0.1", "example.org", stats::Result::kFiltered, 500});

  httplib::Client client("http://127.0.0.1:18095");
  auto res = client.Get("/control/stats");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto body = json::parse(res->body);
  EXPECT_EQ(body["num_dns_queries"], 1);
  EXPECT_EQ(body["num_blocked_filtering"], 1);

  res = client.Post("/control/stats_config", R"({"interval": 30})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(config_writes.load(), 1);

  res = client.Get("/control/stats_info");
  ASSERT_TRUE(res);
  EXPECT_EQ(json::parse(res->body)["interval"], 30);

  res = client.Post("/control/stats_config", R"({"interval": 5})", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);

  res = client.Get("/control/stats/top_clients?limit=5");
  ASSERT_TRUE(res);
  EXPECT_EQ(json::parse(res->body)["clients"], json::parse(R"(["127.0.0.1"])"));

  http_server->Stop();
  EXPECT_TRUE((*engine)->Shutdown().has_value());
  std::filesystem::remove_all(dir);
}

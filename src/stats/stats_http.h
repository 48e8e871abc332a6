/**
 * @file stats_http.h
 * @brief Statistics control endpoints
 *
 * Endpoints:
 * - GET /control/stats - Report for the retention window
 * - POST /control/stats_reset - Delete all statistics
 * - GET /control/stats_info - {"interval": days}
 * - POST /control/stats_config - Change retention, body {"interval": days}
 * - GET /control/stats/top_clients?limit=N - Most active client addresses
 */

#pragma once

#include "stats/route_registrar.h"

namespace dnsstatd::stats {

class StatsEngine;

/**
 * @brief Register the statistics endpoints for engine
 *
 * engine must outlive every registered handler.
 */
void RegisterStatsRoutes(RouteRegistrar& registrar, StatsEngine& engine);

// Handlers, also used directly by tests
ApiResponse HandleGetStats(StatsEngine& engine, const ApiRequest& req);
ApiResponse HandleStatsReset(StatsEngine& engine, const ApiRequest& req);
ApiResponse HandleStatsInfo(StatsEngine& engine, const ApiRequest& req);
ApiResponse HandleStatsConfig(StatsEngine& engine, const ApiRequest& req);
ApiResponse HandleTopClients(StatsEngine& engine, const ApiRequest& req);

}  // namespace dnsstatd::stats

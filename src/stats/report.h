/**
 * @file report.h
 * @brief Statistics report returned to API callers
 */

#pragma once

#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "stats/aggregator.h"
#include "stats/unit.h"

namespace dnsstatd::stats {

/**
 * @brief Aggregated view of a retention window
 */
struct Report {
  TimeUnit time_unit = TimeUnit::kDays;

  // Per hour or per day series
  std::vector<uint64_t> dns_queries;
  std::vector<uint64_t> blocked_filtering;
  std::vector<uint64_t> replaced_safebrowsing;
  std::vector<uint64_t> replaced_parental;

  std::vector<NameCount> top_queried_domains;
  std::vector<NameCount> top_blocked_domains;
  std::vector<NameCount> top_clients;

  Totals totals;
  double avg_processing_time = 0.0;  ///< Seconds
};

/**
 * @brief Build a report from a loaded window
 *
 * @param records Window, oldest first
 * @param first_id Bucket id of records[0]
 * @param ignored Domains left out of the top domain tables (may be nullptr)
 */
Report BuildReport(const std::vector<UnitRecord>& records, uint32_t first_id, const IgnoreList* ignored);

/**
 * @brief Map a report to its JSON shape
 *
 * Top tables are arrays of single-key objects: [{"example.org": 12}, ...].
 */
nlohmann::json ReportToJson(const Report& report);

}  // namespace dnsstatd::stats

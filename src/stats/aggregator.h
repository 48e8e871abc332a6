/**
 * @file aggregator.h
 * @brief Query-time aggregation over a window of unit records
 *
 * All functions are pure. The window is a contiguous run of hourly records
 * starting at first_id, oldest first.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "stats/ignore_list.h"
#include "stats/unit.h"

namespace dnsstatd::stats {

/// Maximum number of domains in a report table
constexpr size_t kMaxReportDomains = 100;

/// Maximum number of clients in a report table
constexpr size_t kMaxReportClients = 100;

/**
 * @brief Granularity of report series
 */
enum class TimeUnit : std::uint8_t { kHours, kDays };

/**
 * @brief Report label for a time unit ("hours" or "days")
 */
const char* TimeUnitToString(TimeUnit unit);

/**
 * @brief Pick the series granularity for a window
 * @return kDays when the window is longer than seven days
 */
TimeUnit SelectTimeUnit(uint32_t limit_hours);

using NumberGetter = std::function<uint64_t(const UnitRecord&)>;
using PairsGetter = std::function<const std::vector<NameCount>&(const UnitRecord&)>;

/**
 * @brief Turn a window into an hourly or daily series
 *
 * Hourly output has one element per record. Daily output closes a day at
 * every id that is a multiple of 24; the partial stretch before the first
 * boundary is added to the first day, and a partial last day becomes the
 * last element. A window of 24 * d records therefore always yields d
 * elements, whatever first_id % 24 is.
 *
 * @param records Window, oldest first
 * @param first_id Bucket id of records[0]
 * @param unit Output granularity
 * @param metric Value extracted from each record
 */
std::vector<uint64_t> CollectSeries(const std::vector<UnitRecord>& records, uint32_t first_id, TimeUnit unit,
                                    const NumberGetter& metric);

/**
 * @brief Merge per-record name tables and keep the top entries
 *
 * @param records Window
 * @param max_size Maximum output size
 * @param pairs Table extracted from each record
 * @param exclude Names to drop before ranking (may be nullptr)
 * @return Entries sorted by descending count, then ascending name
 */
std::vector<NameCount> CollectTopN(const std::vector<UnitRecord>& records, size_t max_size, const PairsGetter& pairs,
                                   const IgnoreList* exclude = nullptr);

/**
 * @brief Average processing time in seconds
 *
 * Mean of the per-record averages over records whose average is non-zero,
 * using integer microsecond division. This is not weighted by query count;
 * existing dashboards depend on the value as computed here.
 */
double AverageProcessingTime(const std::vector<UnitRecord>& records);

/**
 * @brief Window-wide counters
 */
struct Totals {
  uint64_t num_dns_queries = 0;
  uint64_t num_blocked_filtering = 0;
  uint64_t num_replaced_safebrowsing = 0;
  uint64_t num_replaced_safesearch = 0;
  uint64_t num_replaced_parental = 0;
};

/**
 * @brief Sum totals and histogram slots over the window
 */
Totals SumTotals(const std::vector<UnitRecord>& records);

}  // namespace dnsstatd::stats

/**
 * @file aggregator.cpp
 * @brief Query-time aggregation over a window of unit records
 */

#include "stats/aggregator.h"

#include "stats/unit_id.h"

namespace dnsstatd::stats {

namespace {

constexpr uint32_t kDaysForDailySeries = 7;
constexpr double kMicrosecondsPerSecond = 1000000.0;

}  // namespace

const char* TimeUnitToString(TimeUnit unit) {
  return unit == TimeUnit::kDays ? "days" : "hours";
}

TimeUnit SelectTimeUnit(uint32_t limit_hours) {
  return limit_hours / kHoursPerDay > kDaysForDailySeries ? TimeUnit::kDays : TimeUnit::kHours;
}

std::vector<uint64_t> CollectSeries(const std::vector<UnitRecord>& records, uint32_t first_id, TimeUnit unit,
                                    const NumberGetter& metric) {
  std::vector<uint64_t> series;

  if (unit == TimeUnit::kHours) {
    series.reserve(records.size());
    for (const auto& record : records) {
      series.push_back(metric(record));
    }
    return series;
  }

  uint32_t first_day_id = AlignCeil(first_id, kHoursPerDay);
  uint32_t next_day_id = first_day_id + kHoursPerDay;
  uint64_t sum = 0;
  bool pending = false;

  uint32_t id = first_id;
  for (const auto& record : records) {
    sum += metric(record);
    pending = true;
    ++id;
    if (id == next_day_id) {
      series.push_back(sum);
      sum = 0;
      pending = false;
      next_day_id += kHoursPerDay;
    }
  }
  if (pending) {
    series.push_back(sum);
  }

  return series;
}

std::vector<NameCount> CollectTopN(const std::vector<UnitRecord>& records, size_t max_size, const PairsGetter& pairs,
                                   const IgnoreList* exclude) {
  NameCountMap merged;
  for (const auto& record : records) {
    for (const auto& entry : pairs(record)) {
      if (exclude != nullptr && exclude->Has(entry.name)) {
        continue;
      }
      merged[entry.name] += entry.count;
    }
  }
  return ConvertMapToSlice(merged, max_size);
}

double AverageProcessingTime(const std::vector<UnitRecord>& records) {
  uint64_t sum = 0;
  uint64_t count = 0;
  for (const auto& record : records) {
    if (record.average_duration_us != 0) {
      sum += record.average_duration_us;
      ++count;
    }
  }
  if (count == 0) {
    return 0.0;
  }
  return static_cast<double>(sum / count) / kMicrosecondsPerSecond;
}

Totals SumTotals(const std::vector<UnitRecord>& records) {
  Totals totals;
  for (const auto& record : records) {
    totals.num_dns_queries += record.total;
    totals.num_blocked_filtering += record.Count(Result::kFiltered);
    totals.num_replaced_safebrowsing += record.Count(Result::kSafeBrowsing);
    totals.num_replaced_safesearch += record.Count(Result::kSafeSearch);
    totals.num_replaced_parental += record.Count(Result::kParental);
  }
  return totals;
}

}  // namespace dnsstatd::stats

/**
 * @file unit.cpp
 * @brief Hourly statistics bucket implementation
 */

#include "stats/unit.h"

#include <algorithm>
#include <cstddef>
#include <limits>

namespace dnsstatd::stats {

std::vector<NameCount> ConvertMapToSlice(const NameCountMap& names, size_t max_size) {
  std::vector<NameCount> result;
  result.reserve(names.size());
  for (const auto& [name, count] : names) {
    result.push_back({name, count});
  }

  auto by_count = [](const NameCount& lhs, const NameCount& rhs) {
    if (lhs.count != rhs.count) {
      return lhs.count > rhs.count;
    }
    return lhs.name < rhs.name;
  };

  if (result.size() > max_size) {
    std::partial_sort(result.begin(), result.begin() + static_cast<std::ptrdiff_t>(max_size), result.end(), by_count);
    result.resize(max_size);
  } else {
    std::sort(result.begin(), result.end(), by_count);
  }
  return result;
}

NameCountMap ConvertSliceToMap(const std::vector<NameCount>& names) {
  NameCountMap result;
  result.reserve(names.size());
  for (const auto& entry : names) {
    result[entry.name] += entry.count;
  }
  return result;
}

void Unit::Add(Result result, const std::string& domain, const std::string& client, uint64_t duration_us) {
  histogram_[static_cast<size_t>(result)]++;

  if (result == Result::kNotFiltered) {
    domains_[domain]++;
  } else {
    blocked_domains_[domain]++;
  }

  clients_[client]++;
  time_sum_us_ += duration_us;
  total_++;
}

UnitRecord Unit::Serialize() const {
  UnitRecord record;
  record.histogram.assign(histogram_.begin(), histogram_.end());
  record.domains = ConvertMapToSlice(domains_, kMaxNamesPerUnit);
  record.blocked_domains = ConvertMapToSlice(blocked_domains_, kMaxNamesPerUnit);
  record.clients = ConvertMapToSlice(clients_, kMaxNamesPerUnit);
  record.total = total_;
  if (total_ != 0) {
    uint64_t average = time_sum_us_ / total_;
    record.average_duration_us = static_cast<uint32_t>(std::min<uint64_t>(average, std::numeric_limits<uint32_t>::max()));
  }
  return record;
}

Unit Unit::Deserialize(uint32_t id, const UnitRecord& record) {
  Unit unit(id);
  // Slots this build does not know about are dropped; missing slots stay 0
  size_t slots = std::min(record.histogram.size(), unit.histogram_.size());
  for (size_t i = 0; i < slots; ++i) {
    unit.histogram_[i] = record.histogram[i];
  }
  unit.domains_ = ConvertSliceToMap(record.domains);
  unit.blocked_domains_ = ConvertSliceToMap(record.blocked_domains);
  unit.clients_ = ConvertSliceToMap(record.clients);
  unit.total_ = record.total;
  unit.time_sum_us_ = static_cast<uint64_t>(record.average_duration_us) * record.total;
  return unit;
}

}  // namespace dnsstatd::stats

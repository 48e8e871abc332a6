/**
 * @file unit.h
 * @brief Hourly statistics bucket and its serializable snapshot
 *
 * A Unit is the live, mutable aggregate of one bucket of wall-clock time.
 * A UnitRecord is the immutable snapshot that gets persisted; its name
 * tables are cut down to the top kMaxNamesPerUnit entries.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "stats/entry.h"

namespace dnsstatd::stats {

/// Maximum number of names kept per table when a unit is serialized
constexpr size_t kMaxNamesPerUnit = 100;

/**
 * @brief Name with its counter
 */
struct NameCount {
  std::string name;
  uint64_t count = 0;

  bool operator==(const NameCount& other) const { return name == other.name && count == other.count; }
};

using NameCountMap = std::unordered_map<std::string, uint64_t>;

/**
 * @brief Serializable snapshot of a Unit
 */
struct UnitRecord {
  std::vector<uint64_t> histogram = std::vector<uint64_t>(kResultCount, 0);  ///< Indexed by Result
  std::vector<NameCount> domains;          ///< Top not-filtered domains
  std::vector<NameCount> blocked_domains;  ///< Top blocked domains
  std::vector<NameCount> clients;          ///< Top clients
  uint64_t total = 0;                      ///< Number of counted queries
  uint32_t average_duration_us = 0;        ///< Mean processing time per query

  /**
   * @brief Histogram slot for a result (0 if the record predates the slot)
   */
  uint64_t Count(Result result) const {
    auto index = static_cast<size_t>(result);
    return index < histogram.size() ? histogram[index] : 0;
  }
};

/**
 * @brief Sort a name map by descending count and keep the first max_size
 *
 * Ties are broken by ascending name so the output does not depend on hash
 * map iteration order.
 */
std::vector<NameCount> ConvertMapToSlice(const NameCountMap& names, size_t max_size);

/**
 * @brief Rebuild a name map from a NameCount list
 */
NameCountMap ConvertSliceToMap(const std::vector<NameCount>& names);

/**
 * @brief Live aggregate for one time bucket
 *
 * Not thread-safe. The engine guards the current unit with its own lock.
 */
class Unit {
 public:
  explicit Unit(uint32_t id) : id_(id) {}

  /**
   * @brief Count one query
   *
   * @param result Filtering outcome (must be a valid countable result)
   * @param domain Queried domain; goes to the blocked table unless not filtered
   * @param client Client identifier
   * @param duration_us Processing time in microseconds
   */
  void Add(Result result, const std::string& domain, const std::string& client, uint64_t duration_us);

  /**
   * @brief Take a snapshot with truncated name tables
   */
  UnitRecord Serialize() const;

  /**
   * @brief Rebuild a unit from a stored snapshot
   *
   * The running duration sum becomes average * total, so sub-average
   * precision is lost.
   */
  static Unit Deserialize(uint32_t id, const UnitRecord& record);

  uint32_t id() const { return id_; }
  uint64_t total() const { return total_; }
  uint64_t time_sum_us() const { return time_sum_us_; }
  uint64_t Count(Result result) const { return histogram_[static_cast<size_t>(result)]; }
  const NameCountMap& domains() const { return domains_; }
  const NameCountMap& blocked_domains() const { return blocked_domains_; }
  const NameCountMap& clients() const { return clients_; }

 private:
  uint32_t id_;
  std::array<uint64_t, kResultCount> histogram_{};
  NameCountMap domains_;
  NameCountMap blocked_domains_;
  NameCountMap clients_;
  uint64_t total_ = 0;
  uint64_t time_sum_us_ = 0;
};

}  // namespace dnsstatd::stats

/**
 * @file entry.h
 * @brief Ingestion event and filtering result codes
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dnsstatd::stats {

/**
 * @brief Outcome of filtering one DNS query
 *
 * Values index the per-unit result histogram. kNone is never counted.
 */
enum class Result : std::uint8_t {
  kNone = 0,
  kNotFiltered,
  kFiltered,
  kSafeBrowsing,
  kSafeSearch,
  kParental,
  kLast,
};

/// Number of histogram slots (one per Result value below kLast)
constexpr size_t kResultCount = static_cast<size_t>(Result::kLast);

/**
 * @brief Get the wire name of a result ("not_filtered", "filtered", ...)
 */
const char* ResultToString(Result result);

/**
 * @brief Parse a result name as produced by ResultToString()
 * @return Result, or nullopt for unknown names and "none"
 */
std::optional<Result> ParseResult(const std::string& name);

/**
 * @brief One DNS query as seen by the statistics engine
 */
struct Entry {
  std::string client;               ///< Client IP address or opaque client ID
  std::string domain;               ///< Queried domain name
  Result result = Result::kNone;    ///< Filtering outcome
  uint32_t processing_time_us = 0;  ///< Time spent processing the query, in microseconds

  /**
   * @brief Check that the entry can be counted
   *
   * Entries with kNone or an out-of-range result, an empty domain or an
   * empty client are invalid.
   */
  bool IsValid() const;
};

}  // namespace dnsstatd::stats

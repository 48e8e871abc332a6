/**
 * @file unit_id.h
 * @brief Bucket identity scheme and retention intervals
 *
 * Bucket ids are hours since the Unix epoch. A 32-bit unsigned id wraps only
 * after about 490,000 years. Store keys are the 4-byte big-endian encoding of
 * the id, so byte-wise key order equals chronological order.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace dnsstatd::stats {

/// Hours per bucket-id day
constexpr uint32_t kHoursPerDay = 24;

/// Retention used when a stored value is not a supported interval
constexpr uint32_t kDefaultRetentionDays = 1;

/// Width of an encoded bucket key in bytes
constexpr size_t kUnitKeySize = 4;

/**
 * @brief Source of the current bucket id
 *
 * Tests inject a controllable generator to simulate elapsed hours.
 */
using UnitIdGenerator = std::function<uint32_t()>;

/**
 * @brief Check that a retention interval is supported
 * @param days Retention in days
 * @return true for 0 (disabled), 1, 7, 30 or 90
 */
bool CheckInterval(uint32_t days);

/**
 * @brief Default generator: hours since the Unix epoch
 */
uint32_t NewUnitId();

/**
 * @brief Encode a bucket id as an order-preserving store key
 */
std::string IdToKey(uint32_t id);

/**
 * @brief Decode a store key
 * @return Bucket id, or nullopt when the key is not kUnitKeySize bytes
 */
std::optional<uint32_t> KeyToId(std::string_view key);

/**
 * @brief Round id up to the next multiple of align
 */
inline uint32_t AlignCeil(uint32_t id, uint32_t align) {
  uint32_t remainder = id % align;
  return remainder == 0 ? id : id + (align - remainder);
}

}  // namespace dnsstatd::stats

/**
 * @file unit_record_format.h
 * @brief Binary encoding of persisted unit records
 *
 * Every stored value starts with a 16-byte header:
 *   - 4 bytes: Magic number "DSUR"
 *   - 4 bytes: Format version (uint32_t)
 *   - 4 bytes: Payload length in bytes (uint32_t)
 *   - 4 bytes: CRC32 of the payload (uint32_t)
 *
 * Version 1 payload, in this order:
 *   - ResultHistogram: uint32_t count, then count x uint64_t
 *   - Domains, BlockedDomains, Clients: uint32_t count, then count x
 *     (uint32_t length + bytes, uint64_t count)
 *   - Total: uint64_t
 *   - AverageDuration: uint32_t (microseconds)
 *
 * Integers are written in host byte order (little-endian on supported
 * targets). Field order is part of the durable format;
 * new fields require a new version.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "stats/unit.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace dnsstatd::storage {

/**
 * @brief Unit record format constants
 */
namespace unit_record_format {

// Magic number ("DSUR" in ASCII)
constexpr std::array<char, 4> kMagicNumber = {'D', 'S', 'U', 'R'};

// Version we write
constexpr uint32_t kCurrentVersion = 1;

// Versions we can read
constexpr uint32_t kMinSupportedVersion = 1;
constexpr uint32_t kMaxSupportedVersion = 1;

// Fixed header size (magic + version + payload length + CRC32)
constexpr size_t kHeaderSize = 16;

// Upper bounds checked while decoding, to reject corrupted lengths before allocating
constexpr uint32_t kMaxStringLength = 64 * 1024;
constexpr uint32_t kMaxListLength = 64 * 1024;

}  // namespace unit_record_format

/**
 * @brief Calculate CRC32 checksum (zlib)
 */
uint32_t CalculateCRC32(const void* data, size_t length);

/**
 * @brief Calculate CRC32 checksum of a string
 */
uint32_t CalculateCRC32(const std::string& str);

/**
 * @brief Encode a unit record with the current format version
 *
 * @param record Record to encode
 * @return Encoded bytes, or kStoreWriteError
 */
utils::Expected<std::string, utils::Error> EncodeUnitRecord(const stats::UnitRecord& record);

/**
 * @brief Decode a stored unit record
 *
 * @param data Encoded bytes
 * @return Record, kRecordCorrupted for bad magic, length, CRC or payload,
 *         or kRecordVersionUnsupported for an unknown version
 */
utils::Expected<stats::UnitRecord, utils::Error> DecodeUnitRecord(std::string_view data);

}  // namespace dnsstatd::storage

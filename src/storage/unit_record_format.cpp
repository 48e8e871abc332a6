/**
 * @file unit_record_format.cpp
 * @brief Binary encoding of persisted unit records
 */

#include "storage/unit_record_format.h"

#include <zlib.h>

#include <cstring>
#include <sstream>
#include <vector>

#include "utils/structured_log.h"

namespace dnsstatd::storage {

using namespace utils;

namespace {

/**
 * @brief Write binary data to stream
 */
template <typename T>
bool WriteBinary(std::ostream& output_stream, const T& value) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  output_stream.write(reinterpret_cast<const char*>(&value), sizeof(T));
  return output_stream.good();
}

/**
 * @brief Read binary data from stream
 */
template <typename T>
bool ReadBinary(std::istream& input_stream, T& value) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  input_stream.read(reinterpret_cast<char*>(&value), sizeof(T));
  return input_stream.good();
}

/**
 * @brief Write string to stream (length-prefixed)
 */
bool WriteString(std::ostream& output_stream, const std::string& str) {
  auto len = static_cast<uint32_t>(str.size());
  if (!WriteBinary(output_stream, len)) {
    return false;
  }
  if (len > 0) {
    output_stream.write(str.data(), len);
  }
  return output_stream.good();
}

/**
 * @brief Read string from stream (length-prefixed)
 */
bool ReadString(std::istream& input_stream, std::string& str) {
  uint32_t len = 0;
  if (!ReadBinary(input_stream, len)) {
    return false;
  }
  if (len > unit_record_format::kMaxStringLength) {
    LogStoreError("record_read", "string_length_exceeded", "String length " + std::to_string(len) + " exceeds limit");
    return false;
  }
  if (len > 0) {
    str.resize(len);
    input_stream.read(str.data(), len);
  } else {
    str.clear();
  }
  return input_stream.good();
}

bool WriteNameCounts(std::ostream& output_stream, const std::vector<stats::NameCount>& names) {
  if (!WriteBinary(output_stream, static_cast<uint32_t>(names.size()))) {
    return false;
  }
  for (const auto& entry : names) {
    if (!WriteString(output_stream, entry.name) || !WriteBinary(output_stream, entry.count)) {
      return false;
    }
  }
  return true;
}

bool ReadNameCounts(std::istream& input_stream, std::vector<stats::NameCount>& names) {
  uint32_t size = 0;
  if (!ReadBinary(input_stream, size) || size > unit_record_format::kMaxListLength) {
    return false;
  }
  names.clear();
  names.reserve(size);
  for (uint32_t i = 0; i < size; ++i) {
    stats::NameCount entry;
    if (!ReadString(input_stream, entry.name) || !ReadBinary(input_stream, entry.count)) {
      return false;
    }
    names.push_back(std::move(entry));
  }
  return true;
}

Expected<std::string, Error> EncodePayloadV1(const stats::UnitRecord& record) {
  std::ostringstream payload;

  if (!WriteBinary(payload, static_cast<uint32_t>(record.histogram.size()))) {
    return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, "Failed to write result histogram"));
  }
  for (uint64_t count : record.histogram) {
    if (!WriteBinary(payload, count)) {
      return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, "Failed to write result histogram"));
    }
  }
  if (!WriteNameCounts(payload, record.domains)) {
    return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, "Failed to write domains"));
  }
  if (!WriteNameCounts(payload, record.blocked_domains)) {
    return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, "Failed to write blocked domains"));
  }
  if (!WriteNameCounts(payload, record.clients)) {
    return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, "Failed to write clients"));
  }
  if (!WriteBinary(payload, record.total) || !WriteBinary(payload, record.average_duration_us)) {
    return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, "Failed to write totals"));
  }

  return payload.str();
}

Expected<stats::UnitRecord, Error> DecodePayloadV1(const std::string& payload) {
  std::istringstream input(payload);
  stats::UnitRecord record;

  uint32_t slots = 0;
  if (!ReadBinary(input, slots) || slots > unit_record_format::kMaxListLength) {
    return MakeUnexpected(MakeError(ErrorCode::kRecordCorrupted, "Failed to read result histogram"));
  }
  record.histogram.assign(slots, 0);
  for (uint32_t i = 0; i < slots; ++i) {
    if (!ReadBinary(input, record.histogram[i])) {
      return MakeUnexpected(MakeError(ErrorCode::kRecordCorrupted, "Failed to read result histogram"));
    }
  }
  if (!ReadNameCounts(input, record.domains)) {
    return MakeUnexpected(MakeError(ErrorCode::kRecordCorrupted, "Failed to read domains"));
  }
  if (!ReadNameCounts(input, record.blocked_domains)) {
    return MakeUnexpected(MakeError(ErrorCode::kRecordCorrupted, "Failed to read blocked domains"));
  }
  if (!ReadNameCounts(input, record.clients)) {
    return MakeUnexpected(MakeError(ErrorCode::kRecordCorrupted, "Failed to read clients"));
  }
  if (!ReadBinary(input, record.total) || !ReadBinary(input, record.average_duration_us)) {
    return MakeUnexpected(MakeError(ErrorCode::kRecordCorrupted, "Failed to read totals"));
  }
  if (input.peek() != std::char_traits<char>::eof()) {
    return MakeUnexpected(MakeError(ErrorCode::kRecordCorrupted, "Trailing bytes after record payload"));
  }

  return record;
}

}  // namespace

// ============================================================================
// CRC32 Calculation
// ============================================================================

uint32_t CalculateCRC32(const void* data, size_t length) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(length)));
}

uint32_t CalculateCRC32(const std::string& str) {
  return CalculateCRC32(str.data(), str.size());
}

// ============================================================================
// Record encoding
// ============================================================================

Expected<std::string, Error> EncodeUnitRecord(const stats::UnitRecord& record) {
  auto payload = EncodePayloadV1(record);
  if (!payload) {
    return MakeUnexpected(payload.error());
  }

  std::ostringstream output;
  output.write(unit_record_format::kMagicNumber.data(), unit_record_format::kMagicNumber.size());
  if (!WriteBinary(output, unit_record_format::kCurrentVersion) ||
      !WriteBinary(output, static_cast<uint32_t>(payload->size())) ||
      !WriteBinary(output, CalculateCRC32(*payload))) {
    return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, "Failed to write record header"));
  }
  output.write(payload->data(), static_cast<std::streamsize>(payload->size()));
  if (!output.good()) {
    return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, "Failed to write record payload"));
  }

  return output.str();
}

Expected<stats::UnitRecord, Error> DecodeUnitRecord(std::string_view data) {
  if (data.size() < unit_record_format::kHeaderSize) {
    return MakeUnexpected(MakeError(ErrorCode::kRecordCorrupted, "Record shorter than header",
                                    "size=" + std::to_string(data.size())));
  }

  if (std::memcmp(data.data(), unit_record_format::kMagicNumber.data(), unit_record_format::kMagicNumber.size()) !=
      0) {
    return MakeUnexpected(MakeError(ErrorCode::kRecordCorrupted, "Invalid record magic number"));
  }

  uint32_t version = 0;
  uint32_t payload_length = 0;
  uint32_t stored_crc = 0;
  std::memcpy(&version, data.data() + 4, sizeof(version));
  std::memcpy(&payload_length, data.data() + 8, sizeof(payload_length));
  std::memcpy(&stored_crc, data.data() + 12, sizeof(stored_crc));

  if (version < unit_record_format::kMinSupportedVersion || version > unit_record_format::kMaxSupportedVersion) {
    return MakeUnexpected(MakeError(ErrorCode::kRecordVersionUnsupported, "Unsupported record format version",
                                    "version=" + std::to_string(version)));
  }

  if (payload_length != data.size() - unit_record_format::kHeaderSize) {
    return MakeUnexpected(MakeError(ErrorCode::kRecordCorrupted, "Record payload length mismatch",
                                    "expected=" + std::to_string(payload_length) +
                                        " actual=" + std::to_string(data.size() - unit_record_format::kHeaderSize)));
  }

  std::string payload(data.substr(unit_record_format::kHeaderSize));
  uint32_t actual_crc = CalculateCRC32(payload);
  if (actual_crc != stored_crc) {
    return MakeUnexpected(MakeError(ErrorCode::kRecordCorrupted, "Record CRC32 mismatch",
                                    "expected=" + std::to_string(stored_crc) + " actual=" + std::to_string(actual_crc)));
  }

  return DecodePayloadV1(payload);
}

}  // namespace dnsstatd::storage

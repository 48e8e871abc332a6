/**
 * @file unit_id.cpp
 * @brief Bucket identity scheme and retention intervals
 */

#include "stats/unit_id.h"

#include <array>
#include <chrono>

namespace dnsstatd::stats {

namespace {

constexpr std::array<uint32_t, 5> kSupportedIntervals = {0, 1, 7, 30, 90};

}  // namespace

bool CheckInterval(uint32_t days) {
  for (uint32_t interval : kSupportedIntervals) {
    if (interval == days) {
      return true;
    }
  }
  return false;
}

uint32_t NewUnitId() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::hours>(now).count());
}

std::string IdToKey(uint32_t id) {
  std::string key(kUnitKeySize, '\0');
  key[0] = static_cast<char>((id >> 24) & 0xFF);
  key[1] = static_cast<char>((id >> 16) & 0xFF);
  key[2] = static_cast<char>((id >> 8) & 0xFF);
  key[3] = static_cast<char>(id & 0xFF);
  return key;
}

std::optional<uint32_t> KeyToId(std::string_view key) {
  if (key.size() != kUnitKeySize) {
    return std::nullopt;
  }
  uint32_t id = 0;
  for (char byte : key) {
    id = (id << 8) | static_cast<uint8_t>(byte);
  }
  return id;
}

}  // namespace dnsstatd::stats

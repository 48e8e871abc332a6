/**
 * @file network_utils.cpp
 * @brief IP address parsing, client anonymization and CIDR allow lists
 */

#include "utils/network_utils.h"

#include <arpa/inet.h>

#include <cstring>

namespace dnsstatd::utils {

namespace {

constexpr int kBitsPerByte = 8;
constexpr size_t kIPv4Bytes = 4;
constexpr size_t kMappedPrefixBytes = 12;

bool ParsePrefixLength(const std::string& str, int max_value, int& out) {
  if (str.empty() || str.size() > 3) {
    return false;
  }
  int value = 0;
  for (char chr : str) {
    if (chr < '0' || chr > '9') {
      return false;
    }
    value = value * 10 + (chr - '0');
  }
  if (value > max_value) {
    return false;
  }
  out = value;
  return true;
}

}  // namespace

std::optional<IpAddress> IpAddress::Parse(const std::string& text) {
  IpAddress addr;
  in_addr v4{};
  if (inet_pton(AF_INET, text.c_str(), &v4) == 1) {
    addr.family_ = Family::kV4;
    std::memcpy(addr.bytes_.data(), &v4, sizeof(v4));
    return addr;
  }
  in6_addr v6{};
  if (inet_pton(AF_INET6, text.c_str(), &v6) == 1) {
    addr.family_ = Family::kV6;
    std::memcpy(addr.bytes_.data(), &v6, sizeof(v6));
    return addr;
  }
  return std::nullopt;
}

IpAddress IpAddress::FromIPv4(uint32_t ip) {
  IpAddress addr;
  addr.family_ = Family::kV4;
  addr.bytes_[0] = static_cast<uint8_t>(ip >> 24);
  addr.bytes_[1] = static_cast<uint8_t>(ip >> 16);
  addr.bytes_[2] = static_cast<uint8_t>(ip >> 8);
  addr.bytes_[3] = static_cast<uint8_t>(ip);
  return addr;
}

IpAddress IpAddress::Unmap() const {
  if (IsV4()) {
    return *this;
  }
  for (size_t i = 0; i < kMappedPrefixBytes; ++i) {
    const uint8_t expected = i < 10 ? 0x00 : 0xFF;
    if (bytes_[i] != expected) {
      return *this;
    }
  }
  IpAddress v4;
  v4.family_ = Family::kV4;
  std::memcpy(v4.bytes_.data(), bytes_.data() + kMappedPrefixBytes, kIPv4Bytes);
  return v4;
}

IpAddress IpAddress::Mask(int prefix_bits) const {
  IpAddress masked = *this;
  int bits = BitLength();
  if (prefix_bits < 0) {
    prefix_bits = 0;
  }
  for (int bit = prefix_bits; bit < bits; ++bit) {
    masked.bytes_[bit / kBitsPerByte] &= static_cast<uint8_t>(~(0x80U >> (bit % kBitsPerByte)));
  }
  return masked;
}

std::string IpAddress::ToString() const {
  char buf[INET6_ADDRSTRLEN] = {};
  const char* res = nullptr;
  if (IsV4()) {
    in_addr v4{};
    std::memcpy(&v4, bytes_.data(), sizeof(v4));
    res = inet_ntop(AF_INET, &v4, buf, sizeof(buf));
  } else {
    in6_addr v6{};
    std::memcpy(&v6, bytes_.data(), sizeof(v6));
    res = inet_ntop(AF_INET6, &v6, buf, sizeof(buf));
  }
  return res != nullptr ? std::string(res) : std::string();
}

std::optional<CIDR> CIDR::Parse(const std::string& cidr_str) {
  size_t slash = cidr_str.find('/');
  if (slash == std::string::npos) {
    return std::nullopt;
  }

  auto ip = IpAddress::Parse(cidr_str.substr(0, slash));
  if (!ip) {
    return std::nullopt;
  }

  int prefix_length = 0;
  if (!ParsePrefixLength(cidr_str.substr(slash + 1), ip->BitLength(), prefix_length)) {
    return std::nullopt;
  }

  CIDR cidr;
  cidr.prefix_length = prefix_length;
  cidr.network = ip->Mask(prefix_length);
  return cidr;
}

std::vector<CIDR> ParseAllowCidrs(const std::vector<std::string>& allow_cidrs) {
  std::vector<CIDR> parsed;
  parsed.reserve(allow_cidrs.size());
  for (const auto& cidr_str : allow_cidrs) {
    auto cidr = CIDR::Parse(cidr_str);
    if (cidr) {
      parsed.push_back(*cidr);
    }
  }
  return parsed;
}

bool IsIPAllowed(const std::string& ip_str, const std::vector<CIDR>& allow_cidrs) {
  // Fail-closed
  if (allow_cidrs.empty()) {
    return false;
  }
  auto ip = IpAddress::Parse(ip_str);
  if (!ip) {
    return false;
  }
  const IpAddress client = ip->Unmap();
  for (const auto& cidr : allow_cidrs) {
    if (cidr.Contains(client)) {
      return true;
    }
  }
  return false;
}

bool IsIPAllowed(const std::string& ip_str, const std::vector<std::string>& allow_cidrs) {
  return IsIPAllowed(ip_str, ParseAllowCidrs(allow_cidrs));
}

std::string NormalizeClientId(const std::string& client, bool anonymize) {
  auto addr = IpAddress::Parse(client);
  if (!addr) {
    return client;
  }
  if (anonymize) {
    return addr->Mask(addr->IsV4() ? kAnonymizeIPv4Prefix : kAnonymizeIPv6Prefix).ToString();
  }
  return addr->ToString();
}

}  // namespace dnsstatd::utils

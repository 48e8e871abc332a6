/**
 * @file network_utils.h
 * @brief IP address parsing, client anonymization and CIDR allow lists
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dnsstatd::utils {

/**
 * @brief IPv4 or IPv6 address
 *
 * Stored as 16 bytes in network order. IPv4 addresses occupy the first
 * four bytes.
 */
class IpAddress {
 public:
  enum class Family : std::uint8_t { kV4, kV6 };

  IpAddress() = default;

  /**
   * @brief Parse textual IPv4 or IPv6 address
   * @return Address, or nullopt if the text is not an IP address
   */
  static std::optional<IpAddress> Parse(const std::string& text);

  /**
   * @brief Construct IPv4 address from host-order integer
   */
  static IpAddress FromIPv4(uint32_t ip);

  Family family() const { return family_; }
  bool IsV4() const { return family_ == Family::kV4; }

  /**
   * @brief Convert ::ffff:a.b.c.d to a.b.c.d, return other addresses as is
   */
  IpAddress Unmap() const;

  /**
   * @brief Bit width of the address (32 or 128)
   */
  int BitLength() const { return IsV4() ? 32 : 128; }

  /**
   * @brief Keep the leading prefix_bits bits, zero the rest
   */
  IpAddress Mask(int prefix_bits) const;

  /**
   * @brief Canonical textual form (inet_ntop)
   */
  std::string ToString() const;

  bool operator==(const IpAddress& other) const { return family_ == other.family_ && bytes_ == other.bytes_; }
  bool operator!=(const IpAddress& other) const { return !(*this == other); }

 private:
  Family family_ = Family::kV4;
  std::array<uint8_t, 16> bytes_{};
};

/**
 * @brief IPv4 or IPv6 network in CIDR notation
 */
struct CIDR {
  IpAddress network;  // Already masked
  int prefix_length = 0;

  /**
   * @brief Parse "a.b.c.d/len" or "x:y::z/len"
   * @return CIDR or nullopt on malformed input or a prefix longer than the
   *         address
   */
  static std::optional<CIDR> Parse(const std::string& cidr_str);

  /**
   * @brief Check whether an address belongs to the network
   *
   * Addresses of the other family never match.
   */
  bool Contains(const IpAddress& ip) const {
    return ip.family() == network.family() && ip.Mask(prefix_length) == network;
  }
};

/**
 * @brief Check client address against CIDR strings
 *
 * An empty list denies everything. Unparsable CIDR entries are skipped.
 * IPv4-mapped IPv6 clients (::ffff:a.b.c.d) are matched as IPv4.
 */
bool IsIPAllowed(const std::string& ip_str, const std::vector<std::string>& allow_cidrs);

/**
 * @brief Check client address against pre-parsed CIDRs
 */
bool IsIPAllowed(const std::string& ip_str, const std::vector<CIDR>& allow_cidrs);

/**
 * @brief Parse a list of CIDR strings, dropping invalid entries
 */
std::vector<CIDR> ParseAllowCidrs(const std::vector<std::string>& allow_cidrs);

/// Prefix kept when anonymizing IPv4 clients
constexpr int kAnonymizeIPv4Prefix = 16;

/// Prefix kept when anonymizing IPv6 clients
constexpr int kAnonymizeIPv6Prefix = 112;

/**
 * @brief Normalize a client identifier
 *
 * IP addresses are re-emitted in canonical form and, when anonymize is set,
 * masked to /16 (IPv4) or /112 (IPv6). Other identifiers are returned
 * unchanged.
 */
std::string NormalizeClientId(const std::string& client, bool anonymize);

}  // namespace dnsstatd::utils

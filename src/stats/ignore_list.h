/**
 * @file ignore_list.h
 * @brief Matcher for host names excluded from statistics
 */

#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace dnsstatd::stats {

/**
 * @brief Set of ignored host names
 *
 * Rules are either exact names ("example.org") or wildcards ("*.lan") that
 * match every subdomain but not the name itself. Matching ignores case and a
 * trailing dot.
 */
class IgnoreList {
 public:
  IgnoreList() = default;

  /**
   * @brief Build from rule strings
   * @return List, or kInvalidArgument for an empty or duplicate rule
   */
  static utils::Expected<IgnoreList, utils::Error> Create(const std::vector<std::string>& rules);

  /**
   * @brief Check whether host is ignored
   */
  bool Has(const std::string& host) const;

  bool Empty() const { return exact_.empty() && suffixes_.empty(); }

  /**
   * @brief Rules as given, in order
   */
  const std::vector<std::string>& Rules() const { return rules_; }

 private:
  std::vector<std::string> rules_;
  std::unordered_set<std::string> exact_;
  std::unordered_set<std::string> suffixes_;  // Stored with the leading dot: ".lan"
};

/**
 * @brief Lower-case a host name and strip one trailing dot
 */
std::string NormalizeHost(const std::string& host);

}  // namespace dnsstatd::stats

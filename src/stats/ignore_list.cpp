/**
 * @file ignore_list.cpp
 * @brief Matcher for host names excluded from statistics
 */

#include "stats/ignore_list.h"

#include <algorithm>
#include <cctype>

namespace dnsstatd::stats {

std::string NormalizeHost(const std::string& host) {
  std::string result = host;
  if (!result.empty() && result.back() == '.') {
    result.pop_back();
  }
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  return result;
}

utils::Expected<IgnoreList, utils::Error> IgnoreList::Create(const std::vector<std::string>& rules) {
  IgnoreList list;
  for (const auto& rule : rules) {
    std::string normalized = NormalizeHost(rule);
    if (normalized.empty() || normalized == "*" || normalized == "*.") {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "Empty ignore rule", rule));
    }

    bool inserted = false;
    if (normalized.rfind("*.", 0) == 0) {
      inserted = list.suffixes_.insert(normalized.substr(1)).second;
    } else {
      inserted = list.exact_.insert(normalized).second;
    }
    if (!inserted) {
      return utils::MakeUnexpected(
          utils::MakeError(utils::ErrorCode::kInvalidArgument, "Duplicate ignore rule", rule));
    }
    list.rules_.push_back(rule);
  }
  return list;
}

bool IgnoreList::Has(const std::string& host) const {
  if (Empty()) {
    return false;
  }

  std::string normalized = NormalizeHost(host);
  if (exact_.count(normalized) != 0) {
    return true;
  }

  // Walk parent suffixes: "a.b.lan" -> ".b.lan" -> ".lan"
  size_t pos = normalized.find('.');
  while (pos != std::string::npos) {
    if (suffixes_.count(normalized.substr(pos)) != 0) {
      return true;
    }
    pos = normalized.find('.', pos + 1);
  }
  return false;
}

}  // namespace dnsstatd::stats

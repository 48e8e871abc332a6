/**
 * @file entry.cpp
 * @brief Ingestion event and filtering result codes
 */

#include "stats/entry.h"

namespace dnsstatd::stats {

const char* ResultToString(Result result) {
  switch (result) {
    case Result::kNotFiltered:
      return "not_filtered";
    case Result::kFiltered:
      return "filtered";
    case Result::kSafeBrowsing:
      return "safebrowsing";
    case Result::kSafeSearch:
      return "safesearch";
    case Result::kParental:
      return "parental";
    case Result::kNone:
    case Result::kLast:
      break;
  }
  return "none";
}

std::optional<Result> ParseResult(const std::string& name) {
  for (size_t i = 1; i < kResultCount; ++i) {
    auto result = static_cast<Result>(i);
    if (name == ResultToString(result)) {
      return result;
    }
  }
  return std::nullopt;
}

bool Entry::IsValid() const {
  return result != Result::kNone && result < Result::kLast && !domain.empty() && !client.empty();
}

}  // namespace dnsstatd::stats

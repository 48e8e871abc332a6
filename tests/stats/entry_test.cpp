/**
 * @file entry_test.cpp
 * @brief Tests for ingestion entries and result names
 */

#include "stats/entry.h"

#include <gtest/gtest.h>

using namespace dnsstatd::stats;

TEST(EntryTest, ResultNamesRoundTrip) {
  for (size_t i = 1; i < kResultCount; ++i) {
    auto result = static_cast<Result>(i);
    auto parsed = ParseResult(ResultToString(result));
    ASSERT_TRUE(parsed.has_value()) << ResultToString(result);
    EXPECT_EQ(*parsed, result);
  }
}

TEST(EntryTest, ParseResultRejectsUnknownNames) {
  EXPECT_FALSE(ParseResult("none").has_value());
  EXPECT_FALSE(ParseResult("").has_value());
  EXPECT_FALSE(ParseResult("Filtered").has_value());
}

TEST(EntryTest, IsValid) {
  Entry entry{"192.0.2.1", "example.org", Result::kFiltered, 1500};
  EXPECT_TRUE(entry.IsValid());

  Entry no_domain = entry;
  no_domain.domain.clear();
  EXPECT_FALSE(no_domain.IsValid());

  Entry no_client = entry;
  no_client.client.clear();
  EXPECT_FALSE(no_client.IsValid());

  Entry no_result = entry;
  no_result.result = Result::kNone;
  EXPECT_FALSE(no_result.IsValid());

  Entry out_of_range = entry;
  out_of_range.result = Result::kLast;
  EXPECT_FALSE(out_of_range.IsValid());
}

/**
 * @file report_test.cpp
 * @brief Tests for report assembly and its JSON shape
 */

#include "stats/report.h"

#include <gtest/gtest.h>

#include "stats/unit.h"

using namespace dnsstatd::stats;

namespace {

std::vector<UnitRecord> MakeDayWindow() {
  std::vector<UnitRecord> records(24);

  Unit busy(0);
  busy.Add(Result::kNotFiltered, "example.org", "192.0.2.1", 1000);
  busy.Add(Result::kNotFiltered, "example.org", "192.0.2.2", 1000);
  busy.Add(Result::kNotFiltered, "printer.lan", "192.0.2.2", 1000);
  busy.Add(Result::kFiltered, "ads.example", "192.0.2.1", 3000);
  busy.Add(Result::kSafeBrowsing, "malware.example", "192.0.2.1", 3000);
  records[5] = busy.Serialize();

  Unit quiet(0);
  quiet.Add(Result::kParental, "adult.example", "192.0.2.3", 500);
  records[23] = quiet.Serialize();
  return records;
}

}  // namespace

TEST(ReportTest, BuildHourlyReport) {
  auto ignored = IgnoreList::Create({"*.lan"});
  ASSERT_TRUE(ignored.has_value());

  Report report = BuildReport(MakeDayWindow(), 480000, &*ignored);

  EXPECT_EQ(report.time_unit, TimeUnit::kHours);
  ASSERT_EQ(report.dns_queries.size(), 24U);
  EXPECT_EQ(report.dns_queries[5], 5U);
  EXPECT_EQ(report.dns_queries[23], 1U);
  EXPECT_EQ(report.blocked_filtering[5], 1U);
  EXPECT_EQ(report.replaced_safebrowsing[5], 1U);
  EXPECT_EQ(report.replaced_parental[23], 1U);

  ASSERT_EQ(report.top_queried_domains.size(), 1U);  // printer.lan is ignored
  EXPECT_EQ(report.top_queried_domains[0], (NameCount{"example.org", 2}));
  ASSERT_EQ(report.top_blocked_domains.size(), 3U);
  ASSERT_EQ(report.top_clients.size(), 3U);
  EXPECT_EQ(report.top_clients[0], (NameCount{"192.0.2.1", 3}));

  EXPECT_EQ(report.totals.num_dns_queries, 6U);
  EXPECT_EQ(report.totals.num_blocked_filtering, 1U);
  EXPECT_EQ(report.totals.num_replaced_parental, 1U);
  // Hour averages: 9000 / 5 = 1800 and 500
  EXPECT_DOUBLE_EQ(report.avg_processing_time, 0.00115);
}

TEST(ReportTest, BuildDailyReport) {
  std::vector<UnitRecord> records(30 * 24);
  records.back().total = 7;

  Report report = BuildReport(records, 480000, nullptr);
  EXPECT_EQ(report.time_unit, TimeUnit::kDays);
  ASSERT_EQ(report.dns_queries.size(), 30U);
  EXPECT_EQ(report.dns_queries.back(), 7U);
}

TEST(ReportTest, JsonShape) {
  Report report = BuildReport(MakeDayWindow(), 480000, nullptr);
  nlohmann::json json = ReportToJson(report);

  EXPECT_EQ(json["time_units"], "hours");
  EXPECT_EQ(json["dns_queries"].size(), 24U);
  EXPECT_EQ(json["num_dns_queries"], 6);
  EXPECT_EQ(json["num_blocked_filtering"], 1);
  EXPECT_EQ(json["num_replaced_safebrowsing"], 1);
  EXPECT_EQ(json["num_replaced_safesearch"], 0);
  EXPECT_EQ(json["num_replaced_parental"], 1);
  EXPECT_TRUE(json.contains("avg_processing_time"));
  EXPECT_TRUE(json.contains("replaced_parental"));

  ASSERT_TRUE(json["top_queried_domains"].is_array());
  EXPECT_EQ(json["top_queried_domains"][0], (nlohmann::json{{"example.org", 2}}));
  EXPECT_EQ(json["top_clients"][0], (nlohmann::json{{"192.0.2.1", 3}}));
}

TEST(ReportTest, EmptyReportJson) {
  nlohmann::json json = ReportToJson(Report{});
  EXPECT_EQ(json["time_units"], "days");
  EXPECT_TRUE(json["dns_queries"].empty());
  EXPECT_TRUE(json["top_clients"].is_array());
  EXPECT_EQ(json["num_dns_queries"], 0);
}

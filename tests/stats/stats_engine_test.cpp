/**
 * @file stats_engine_test.cpp
 * @brief Tests for the statistics engine
 *
 * Time is driven through an injected unit id generator; flush steps are
 * invoked directly unless a test exercises the background loop.
 */

#include "stats/stats_engine.h"

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "stats/route_registrar.h"
#include "storage/sqlite_bucket_store.h"

using namespace dnsstatd::stats;
using dnsstatd::utils::ErrorCode;

namespace {

// Day-aligned starting hour
constexpr uint32_t kStartId = 480000;

class StatsEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("dnsstatd_engine_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
    path_ = (dir_ / "stats.db").string();
    unit_id_ = kStartId;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  EngineOptions MakeOptions(uint32_t days) {
    EngineOptions options;
    options.config.file = path_;
    options.config.interval_days = days;
    options.unit_id = [this]() { return unit_id_.load(); };
    return options;
  }

  std::unique_ptr<StatsEngine> CreateEngine(uint32_t days = 1) {
    auto engine = StatsEngine::Create(MakeOptions(days));
    EXPECT_TRUE(engine.has_value()) << engine.error().to_string();
    return engine ? std::move(*engine) : nullptr;
  }

  /**
   * @brief Count buckets through a second connection (engine must be idle)
   */
  size_t CountBuckets() const {
    auto store = dnsstatd::storage::SqliteBucketStore::Open(path_);
    if (!store) {
      ADD_FAILURE() << store.error().to_string();
      return 0;
    }
    size_t count = 0;
    {
      auto txn = (*store)->Begin(false);
      if (!txn) {
        ADD_FAILURE() << txn.error().to_string();
        return 0;
      }
      auto walked = (*txn)->ForEach([&](std::string_view /*name*/) {
        ++count;
        return true;
      });
      EXPECT_TRUE(walked.has_value());
      EXPECT_TRUE((*txn)->Rollback().has_value());
    }
    EXPECT_TRUE((*store)->Close().has_value());
    return count;
  }

  void AdvanceHours(uint32_t hours) { unit_id_ += hours; }

  static Entry MakeEntry(const std::string& client, const std::string& domain, Result result,
                         uint32_t elapsed_us = 1000) {
    return Entry{client, domain, result, elapsed_us};
  }

  std::filesystem::path dir_;
  std::string path_;
  std::atomic<uint32_t> unit_id_{kStartId};
};

class RecordingRegistrar : public RouteRegistrar {
 public:
  void RegisterRoute(HttpMethod method, const std::string& path, RouteHandler handler) override {
    routes.push_back({method, path});
    handlers.push_back(std::move(handler));
  }

  std::vector<std::pair<HttpMethod, std::string>> routes;
  std::vector<RouteHandler> handlers;
};

}  // namespace

// ============================================================================
// Ingestion and reports
// ============================================================================

TEST_F(StatsEngineTest, FilteredAndUnfilteredInSameHour) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  engine->Update(MakeEntry("127.0.0.1", "domain", Result::kFiltered));
  engine->Update(MakeEntry("127.0.0.1", "domain", Result::kNotFiltered));

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value()) << report.error().to_string();
  EXPECT_EQ(report->time_unit, TimeUnit::kHours);
  EXPECT_EQ(report->totals.num_dns_queries, 2U);
  EXPECT_EQ(report->totals.num_blocked_filtering, 1U);
  EXPECT_EQ(report->top_queried_domains, (std::vector<NameCount>{{"domain", 1}}));
  EXPECT_EQ(report->top_blocked_domains, (std::vector<NameCount>{{"domain", 1}}));
  EXPECT_EQ(report->top_clients, (std::vector<NameCount>{{"127.0.0.1", 2}}));
  ASSERT_EQ(report->dns_queries.size(), 24U);
  EXPECT_EQ(report->dns_queries.back(), 2U);
}

TEST_F(StatsEngineTest, HistogramMatchesUpdates) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  const Result results[] = {Result::kNotFiltered, Result::kFiltered,  Result::kSafeBrowsing,
                            Result::kSafeSearch,  Result::kParental,  Result::kNotFiltered,
                            Result::kFiltered,    Result::kNotFiltered};
  for (Result result : results) {
    engine->Update(MakeEntry("192.0.2.1", "example.org", result));
  }

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->totals.num_dns_queries, 8U);
  EXPECT_EQ(report->totals.num_blocked_filtering, 2U);
  EXPECT_EQ(report->totals.num_replaced_safebrowsing, 1U);
  EXPECT_EQ(report->totals.num_replaced_safesearch, 1U);
  EXPECT_EQ(report->totals.num_replaced_parental, 1U);
}

TEST_F(StatsEngineTest, ThousandClientsOverTwelveHours) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  for (int hour = 0; hour < 12; ++hour) {
    for (int client = 0; client < 1000; ++client) {
      std::string address = "10.0." + std::to_string(client / 256) + "." + std::to_string(client % 256);
      engine->Update(MakeEntry(address, "example.org", Result::kNotFiltered));
    }
    AdvanceHours(1);
    FlushResult result = engine->Flush();
    EXPECT_TRUE(result.cont);
    EXPECT_EQ(result.sleep_for.count(), 0);
  }

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value()) << report.error().to_string();
  EXPECT_EQ(report->totals.num_dns_queries, 12000U);
  EXPECT_EQ(report->top_clients.size(), kMaxReportClients);
}

TEST_F(StatsEngineTest, InvalidEntriesAreDropped) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  engine->Update(MakeEntry("", "example.org", Result::kNotFiltered));
  engine->Update(MakeEntry("192.0.2.1", "", Result::kNotFiltered));
  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNone));
  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kLast));

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->totals.num_dns_queries, 0U);
}

TEST_F(StatsEngineTest, AnonymizesClients) {
  auto options = MakeOptions(1);
  options.config.anonymize_client_ip = true;
  auto engine = StatsEngine::Create(std::move(options));
  ASSERT_TRUE(engine.has_value()) << engine.error().to_string();

  (*engine)->Update(MakeEntry("192.168.37.1", "example.org", Result::kNotFiltered));
  (*engine)->Update(MakeEntry("192.168.99.2", "example.org", Result::kNotFiltered));
  (*engine)->Update(MakeEntry("2001:db8::1:2", "example.org", Result::kNotFiltered));

  auto report = (*engine)->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->top_clients,
            (std::vector<NameCount>{{"192.168.0.0", 2}, {"2001:db8::1:0", 1}}));
}

TEST_F(StatsEngineTest, IgnoredDomainsLeftOutOfTopTables) {
  auto options = MakeOptions(1);
  options.config.ignored = {"*.lan", "example.net"};
  auto created = StatsEngine::Create(std::move(options));
  ASSERT_TRUE(created.has_value()) << created.error().to_string();
  auto& engine = *created;

  EXPECT_FALSE(engine->ShouldCount("printer.lan"));
  EXPECT_FALSE(engine->ShouldCount("Example.NET."));
  EXPECT_TRUE(engine->ShouldCount("example.org"));

  engine->Update(MakeEntry("192.0.2.1", "printer.lan", Result::kNotFiltered));
  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->top_queried_domains, (std::vector<NameCount>{{"example.org", 1}}));
  EXPECT_EQ(report->totals.num_dns_queries, 2U);
}

TEST_F(StatsEngineTest, ReportWithExplicitLimit) {
  auto engine = CreateEngine(7);
  ASSERT_NE(engine, nullptr);

  auto week = engine->GetReport();
  ASSERT_TRUE(week.has_value());
  EXPECT_EQ(week->time_unit, TimeUnit::kHours);
  EXPECT_EQ(week->dns_queries.size(), 7U * 24U);

  auto two_days = engine->GetReport(48);
  ASSERT_TRUE(two_days.has_value());
  EXPECT_EQ(two_days->dns_queries.size(), 48U);
}

TEST_F(StatsEngineTest, MonthlyReportIsDaily) {
  auto engine = CreateEngine(30);
  ASSERT_NE(engine, nullptr);

  // Leave the current hour off a day boundary
  AdvanceHours(5);
  ASSERT_TRUE(engine->Flush().cont);
  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->time_unit, TimeUnit::kDays);
  ASSERT_EQ(report->dns_queries.size(), 30U);
  EXPECT_EQ(report->dns_queries.back(), 1U);
}

TEST_F(StatsEngineTest, LoadWindowShape) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
  AdvanceHours(1);
  ASSERT_TRUE(engine->Flush().cont);
  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));

  auto window = engine->LoadWindow(24);
  ASSERT_TRUE(window.has_value()) << window.error().to_string();
  ASSERT_EQ(window->records.size(), 24U);
  EXPECT_EQ(window->first_id, kStartId + 1 - 23);
  EXPECT_EQ(window->records[22].total, 1U);
  EXPECT_EQ(window->records[23].total, 2U);
  EXPECT_EQ(window->records[0].total, 0U);
}

TEST_F(StatsEngineTest, TopClientsSkipsNonAddresses) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  for (int i = 0; i < 3; ++i) {
    engine->Update(MakeEntry("192.0.2.3", "example.org", Result::kNotFiltered));
    engine->Update(MakeEntry("laptop.lan", "example.org", Result::kNotFiltered));
  }
  engine->Update(MakeEntry("2001:db8::1", "example.org", Result::kNotFiltered));
  engine->Update(MakeEntry("192.0.2.3", "example.org", Result::kNotFiltered));

  auto clients = engine->TopClients(10);
  ASSERT_TRUE(clients.has_value()) << clients.error().to_string();
  ASSERT_EQ(clients->size(), 2U);
  EXPECT_EQ((*clients)[0].ToString(), "192.0.2.3");
  EXPECT_EQ((*clients)[1].ToString(), "2001:db8::1");

  auto limited = engine->TopClients(1);
  ASSERT_TRUE(limited.has_value());
  EXPECT_EQ(limited->size(), 1U);
}

// ============================================================================
// Flushing and retention
// ============================================================================

TEST_F(StatsEngineTest, FlushWithinSameHourIsIdle) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  FlushResult result = engine->Flush();
  EXPECT_TRUE(result.cont);
  EXPECT_EQ(result.sleep_for, std::chrono::milliseconds(1000));
  EXPECT_EQ(CountBuckets(), 0U);
}

TEST_F(StatsEngineTest, FlushPersistsRotatedUnit) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
  AdvanceHours(1);
  FlushResult result = engine->Flush();
  EXPECT_TRUE(result.cont);
  EXPECT_EQ(result.sleep_for.count(), 0);
  EXPECT_EQ(CountBuckets(), 1U);

  // Nothing left to write
  result = engine->Flush();
  EXPECT_EQ(result.sleep_for, std::chrono::milliseconds(1000));
}

TEST_F(StatsEngineTest, PersistedBucketsNeverExceedRetention) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  for (int hour = 0; hour < 60; ++hour) {
    engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
    AdvanceHours(1);
    ASSERT_TRUE(engine->Flush().cont);
    ASSERT_LE(CountBuckets(), 24U) << "hour " << hour;
  }

  // Only the last 23 persisted hours and the current hour are reported
  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->totals.num_dns_queries, 23U);

  ASSERT_TRUE(engine->Shutdown().has_value());
  EXPECT_LE(CountBuckets(), 24U);
}

TEST_F(StatsEngineTest, ShrinkingRetentionEvictsImmediately) {
  auto engine = CreateEngine(7);
  ASSERT_NE(engine, nullptr);

  for (int hour = 0; hour < 100; ++hour) {
    engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
    AdvanceHours(1);
    ASSERT_TRUE(engine->Flush().cont);
  }
  EXPECT_EQ(CountBuckets(), 100U);

  ASSERT_TRUE(engine->SetRetention(1).has_value());
  EXPECT_EQ(engine->GetRetentionDays(), 1U);
  // The 23 hours before the current one remain
  EXPECT_EQ(CountBuckets(), 23U);

  AdvanceHours(1);
  ASSERT_TRUE(engine->Flush().cont);
  EXPECT_EQ(CountBuckets(), 23U);

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->totals.num_dns_queries, 23U);
}

TEST_F(StatsEngineTest, FailedFlushKeepsUnitAndRetries) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
  engine->Update(MakeEntry("192.0.2.2", "example.org", Result::kFiltered));

  // Another connection holds the database lock
  sqlite3* other = nullptr;
  ASSERT_EQ(sqlite3_open(path_.c_str(), &other), SQLITE_OK);
  ASSERT_EQ(sqlite3_exec(other, "BEGIN EXCLUSIVE", nullptr, nullptr, nullptr), SQLITE_OK);

  AdvanceHours(1);
  FlushResult result = engine->Flush();
  EXPECT_TRUE(result.cont);
  EXPECT_EQ(result.sleep_for, std::chrono::milliseconds(1000));

  ASSERT_EQ(sqlite3_exec(other, "ROLLBACK", nullptr, nullptr, nullptr), SQLITE_OK);
  ASSERT_EQ(sqlite3_close(other), SQLITE_OK);

  // The rotated hour is still queued and reported
  EXPECT_EQ(CountBuckets(), 0U);
  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->totals.num_dns_queries, 2U);
  EXPECT_EQ(report->totals.num_blocked_filtering, 1U);

  result = engine->Flush();
  EXPECT_TRUE(result.cont);
  EXPECT_EQ(result.sleep_for.count(), 0);
  EXPECT_EQ(CountBuckets(), 1U);

  report = engine->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->totals.num_dns_queries, 2U);
}

TEST_F(StatsEngineTest, SkippedHoursAreZero) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
  AdvanceHours(5);
  ASSERT_TRUE(engine->Flush().cont);

  auto window = engine->LoadWindow(24);
  ASSERT_TRUE(window.has_value());
  EXPECT_EQ(window->records[18].total, 1U);
  for (size_t i = 19; i < 24; ++i) {
    EXPECT_EQ(window->records[i].total, 0U) << i;
  }
}

TEST_F(StatsEngineTest, DisabledRetentionIgnoresUpdates) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);
  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kFiltered));

  ASSERT_TRUE(engine->SetRetention(0).has_value());
  EXPECT_EQ(engine->GetRetentionDays(), 0U);
  for (int i = 0; i < 10; ++i) {
    engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kFiltered));
  }

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->time_unit, TimeUnit::kDays);
  EXPECT_EQ(report->totals.num_dns_queries, 0U);
  EXPECT_EQ(report->totals.num_blocked_filtering, 0U);
  EXPECT_TRUE(report->top_clients.empty());
  EXPECT_DOUBLE_EQ(report->avg_processing_time, 0.0);

  FlushResult result = engine->Flush();
  EXPECT_TRUE(result.cont);
  EXPECT_EQ(result.sleep_for, std::chrono::milliseconds(1000));

  // Re-enabling starts from the cleared state
  ASSERT_TRUE(engine->SetRetention(1).has_value());
  auto enabled = engine->GetReport();
  ASSERT_TRUE(enabled.has_value());
  EXPECT_EQ(enabled->totals.num_dns_queries, 0U);
}

TEST_F(StatsEngineTest, SetRetentionRejectsUnsupportedValues) {
  auto engine = CreateEngine(7);
  ASSERT_NE(engine, nullptr);

  auto result = engine->SetRetention(2);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
  EXPECT_EQ(engine->GetRetentionDays(), 7U);
  EXPECT_EQ(engine->GetConfig().interval_days, 7U);

  ASSERT_TRUE(engine->SetRetention(90).has_value());
  EXPECT_EQ(engine->GetConfig().interval_days, 90U);
  EXPECT_EQ(engine->GetConfig().file, path_);
}

TEST_F(StatsEngineTest, UnsupportedConfiguredIntervalFallsBackToOneDay) {
  auto engine = CreateEngine(3);
  ASSERT_NE(engine, nullptr);
  EXPECT_EQ(engine->GetRetentionDays(), kDefaultRetentionDays);
}

TEST_F(StatsEngineTest, ClearRemovesEverything) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  for (int hour = 0; hour < 5; ++hour) {
    engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
    AdvanceHours(1);
    ASSERT_TRUE(engine->Flush().cont);
  }
  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
  ASSERT_EQ(CountBuckets(), 5U);

  ASSERT_TRUE(engine->Reset().has_value());
  EXPECT_TRUE(std::filesystem::exists(path_));
  EXPECT_EQ(CountBuckets(), 0U);

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value()) << report.error().to_string();
  EXPECT_EQ(report->totals.num_dns_queries, 0U);

  // The engine keeps working on the new store
  engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
  AdvanceHours(1);
  ASSERT_TRUE(engine->Flush().cont);
  EXPECT_EQ(CountBuckets(), 1U);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(StatsEngineTest, RestartInSameHourReloadsCurrentUnit) {
  {
    auto engine = CreateEngine(1);
    ASSERT_NE(engine, nullptr);
    engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kFiltered, 2000));
    engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered, 4000));
    ASSERT_TRUE(engine->Shutdown().has_value());
  }

  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);
  engine->Update(MakeEntry("192.0.2.2", "example.org", Result::kNotFiltered, 3000));

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->totals.num_dns_queries, 3U);
  EXPECT_EQ(report->totals.num_blocked_filtering, 1U);
  EXPECT_EQ(report->top_clients.front(), (NameCount{"192.0.2.1", 2}));
  EXPECT_DOUBLE_EQ(report->avg_processing_time, 0.003);
}

TEST_F(StatsEngineTest, RestartLaterKeepsHistory) {
  {
    auto engine = CreateEngine(1);
    ASSERT_NE(engine, nullptr);
    engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
    ASSERT_TRUE(engine->Shutdown().has_value());
  }

  AdvanceHours(3);
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);

  auto window = engine->LoadWindow(24);
  ASSERT_TRUE(window.has_value());
  EXPECT_EQ(window->records[20].total, 1U);
  EXPECT_EQ(window->records[23].total, 0U);
}

TEST_F(StatsEngineTest, StartupEvictsExpiredUnits) {
  {
    auto engine = CreateEngine(1);
    ASSERT_NE(engine, nullptr);
    for (int hour = 0; hour < 10; ++hour) {
      engine->Update(MakeEntry("192.0.2.1", "example.org", Result::kNotFiltered));
      AdvanceHours(1);
      ASSERT_TRUE(engine->Flush().cont);
    }
    ASSERT_TRUE(engine->Shutdown().has_value());
  }
  ASSERT_EQ(CountBuckets(), 11U);

  AdvanceHours(100);
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);
  EXPECT_EQ(CountBuckets(), 0U);

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->totals.num_dns_queries, 0U);
}

TEST_F(StatsEngineTest, ShutdownIsIdempotent) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);
  engine->Start();

  EXPECT_TRUE(engine->Shutdown().has_value());
  EXPECT_TRUE(engine->Shutdown().has_value());

  FlushResult result = engine->Flush();
  EXPECT_FALSE(result.cont);

  auto report = engine->GetReport();
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error().code(), ErrorCode::kStoreClosed);
}

TEST_F(StatsEngineTest, CreateFailsWhenStoreCannotOpen) {
  auto options = MakeOptions(1);
  options.config.file = dir_.string();  // A directory
  auto engine = StatsEngine::Create(std::move(options));
  ASSERT_FALSE(engine.has_value());
  EXPECT_EQ(engine.error().code(), ErrorCode::kStoreOpenFailed);
}

TEST_F(StatsEngineTest, CreateReportsExceptionDuringInit) {
  auto options = MakeOptions(1);
  options.unit_id = []() -> uint32_t { throw std::runtime_error("clock unavailable"); };
  auto engine = StatsEngine::Create(std::move(options));
  ASSERT_FALSE(engine.has_value());
  EXPECT_EQ(engine.error().code(), ErrorCode::kInternalError);
  EXPECT_NE(engine.error().message().find("clock unavailable"), std::string::npos);
}

TEST_F(StatsEngineTest, CreateRejectsInvalidIgnoreList) {
  auto options = MakeOptions(1);
  options.config.ignored = {"example.org", "example.org"};
  auto engine = StatsEngine::Create(std::move(options));
  ASSERT_FALSE(engine.has_value());
  EXPECT_EQ(engine.error().code(), ErrorCode::kInvalidArgument);
}

TEST_F(StatsEngineTest, StartRegistersRoutesOnce) {
  RecordingRegistrar registrar;
  auto options = MakeOptions(1);
  options.registrar = &registrar;
  auto engine = StatsEngine::Create(std::move(options));
  ASSERT_TRUE(engine.has_value()) << engine.error().to_string();

  (*engine)->Start();
  (*engine)->Start();
  ASSERT_EQ(registrar.routes.size(), 5U);
  EXPECT_EQ(registrar.routes[0].second, "/control/stats");
  ASSERT_TRUE((*engine)->Shutdown().has_value());
}

TEST_F(StatsEngineTest, ConfigModifiedCallback) {
  int calls = 0;
  auto options = MakeOptions(1);
  options.config_modified = [&calls]() { ++calls; };
  auto engine = StatsEngine::Create(std::move(options));
  ASSERT_TRUE(engine.has_value());

  (*engine)->NotifyConfigModified();
  EXPECT_EQ(calls, 1);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(StatsEngineTest, ConcurrentUpdatesFlushesAndReports) {
  auto engine = CreateEngine(1);
  ASSERT_NE(engine, nullptr);
  engine->Start();

  constexpr int kWriters = 4;
  constexpr int kUpdatesPerWriter = 5000;
  std::atomic<bool> writing{true};
  std::atomic<int> report_errors{0};

  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&, w]() {
      for (int i = 0; i < kUpdatesPerWriter; ++i) {
        engine->Update(MakeEntry("10.0.0." + std::to_string(w), "d" + std::to_string(i % 50) + ".example",
                                 i % 3 == 0 ? Result::kFiltered : Result::kNotFiltered));
      }
    });
  }

  std::thread clock([&]() {
    for (int i = 0; i < 4; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      AdvanceHours(1);
      // Rotation also happens here, racing the background loop
      engine->Flush();
    }
  });

  std::thread reader([&]() {
    while (writing.load()) {
      auto report = engine->GetReport();
      if (!report) {
        ++report_errors;
      }
    }
  });

  for (auto& writer : writers) {
    writer.join();
  }
  clock.join();
  writing = false;
  reader.join();

  EXPECT_EQ(report_errors.load(), 0);

  auto report = engine->GetReport();
  ASSERT_TRUE(report.has_value()) << report.error().to_string();
  EXPECT_EQ(report->totals.num_dns_queries, static_cast<uint64_t>(kWriters * kUpdatesPerWriter));

  ASSERT_TRUE(engine->Shutdown().has_value());
}

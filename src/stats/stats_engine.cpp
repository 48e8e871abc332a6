/**
 * @file stats_engine.cpp
 * @brief Round-robin DNS statistics engine
 */

#include "stats/stats_engine.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include "stats/aggregator.h"
#include "stats/stats_http.h"
#include "storage/sqlite_bucket_store.h"
#include "storage/unit_record_format.h"
#include "utils/structured_log.h"

namespace dnsstatd::stats {

namespace {

constexpr std::chrono::milliseconds kIdleFlushInterval{1000};

}  // namespace

// ============================================================================
// Lifecycle
// ============================================================================

StatsEngine::StatsEngine(EngineOptions options)
    : config_(std::move(options.config)),
      unit_id_(std::move(options.unit_id)),
      registrar_(options.registrar),
      config_modified_(std::move(options.config_modified)) {
  if (!unit_id_) {
    unit_id_ = NewUnitId;
  }
}

utils::Expected<std::unique_ptr<StatsEngine>, utils::Error> StatsEngine::Create(EngineOptions options) {
  try {
    std::unique_ptr<StatsEngine> engine(new StatsEngine(std::move(options)));
    auto init = engine->Init();
    if (!init) {
      return utils::MakeUnexpected(init.error());
    }
    return engine;
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInternalError, std::string("Failed to initialize statistics: ") + e.what()));
  }
}

StatsEngine::~StatsEngine() {
  auto result = Shutdown();
  if (!result) {
    utils::LogStatsError("shutdown", result.error().to_string());
  }
}

utils::Expected<void, utils::Error> StatsEngine::Init() {
  if (!CheckInterval(config_.interval_days)) {
    spdlog::warn("Unsupported statistics interval {} days, using {} day(s)", config_.interval_days,
                 kDefaultRetentionDays);
    config_.interval_days = kDefaultRetentionDays;
  }
  retention_hours_.store(config_.interval_days * kHoursPerDay);

  auto ignored = IgnoreList::Create(config_.ignored);
  if (!ignored) {
    return utils::MakeUnexpected(ignored.error());
  }
  ignored_ = std::move(*ignored);

  auto opened = storage::SqliteBucketStore::Open(config_.file);
  if (!opened) {
    return utils::MakeUnexpected(opened.error());
  }
  std::shared_ptr<storage::BucketStore> store = std::move(*opened);

  const uint32_t id = unit_id_();
  const uint32_t limit = retention_hours_.load();

  auto txn = store->Begin(true);
  if (!txn) {
    return utils::MakeUnexpected(txn.error());
  }

  size_t deleted = 0;
  if (id > limit + 1) {
    auto evicted = DeleteOldUnits(**txn, id - limit - 1);
    if (!evicted) {
      utils::LogStatsError("init", "Eviction walk failed: " + evicted.error().to_string());
    } else {
      deleted = *evicted;
    }
  }

  utils::Error read_error;
  auto record = LoadUnitRecord(**txn, id, &read_error);
  if (read_error.code() != utils::ErrorCode::kOk) {
    utils::LogStoreError("init", config_.file, "Failed to read current unit: " + read_error.to_string());
  }

  if (deleted > 0) {
    auto committed = (*txn)->Commit();
    if (!committed) {
      utils::LogStatsError("init", "Failed to commit eviction: " + committed.error().to_string());
    }
  } else {
    auto rolled_back = (*txn)->Rollback();
    if (!rolled_back) {
      spdlog::debug("Statistics init rollback failed: {}", rolled_back.error().to_string());
    }
  }

  current_ = record ? std::make_unique<Unit>(Unit::Deserialize(id, *record)) : std::make_unique<Unit>(id);

  {
    std::lock_guard<std::mutex> lock(store_mutex_);
    store_ = std::move(store);
  }

  spdlog::debug("Statistics initialized: file={} interval={}d current_unit={} evicted={}", config_.file,
                config_.interval_days, id, deleted);
  return {};
}

void StatsEngine::Start() {
  if (shut_down_.load()) {
    return;
  }

  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;  // Already running
  }

  if (registrar_ != nullptr) {
    RegisterStatsRoutes(*registrar_, *this);
  }

  flush_thread_ = std::thread(&StatsEngine::FlushLoop, this);
  spdlog::debug("Statistics flush loop started");
}

utils::Expected<void, utils::Error> StatsEngine::Shutdown() {
  bool expected = false;
  if (!shut_down_.compare_exchange_strong(expected, true)) {
    return {};
  }

  bool was_running = true;
  if (running_.compare_exchange_strong(was_running, false)) {
    loop_cv_.notify_all();
  }
  if (flush_thread_.joinable()) {
    flush_thread_.join();
  }

  std::lock_guard<std::mutex> flush_lock(flush_mutex_);

  std::shared_ptr<storage::BucketStore> store;
  {
    std::lock_guard<std::mutex> lock(store_mutex_);
    store = std::move(store_);
    store_ = nullptr;
  }
  if (!store) {
    return {};
  }

  std::vector<std::pair<uint32_t, UnitRecord>> records;
  if (retention_hours_.load() != 0) {
    std::shared_lock<std::shared_mutex> lock(unit_mutex_);
    for (const auto& [id, unit] : pending_) {
      records.emplace_back(id, unit->Serialize());
    }
    if (current_) {
      records.emplace_back(current_->id(), current_->Serialize());
    }
  }

  utils::Expected<void, utils::Error> result;
  if (!records.empty()) {
    auto txn = store->Begin(true);
    if (!txn) {
      result = utils::MakeUnexpected(txn.error());
    } else {
      for (const auto& [id, record] : records) {
        auto encoded = storage::EncodeUnitRecord(record);
        if (!encoded) {
          result = utils::MakeUnexpected(encoded.error());
          break;
        }
        auto put = (*txn)->Put(IdToKey(id), *encoded);
        if (!put) {
          result = utils::MakeUnexpected(put.error());
          break;
        }
      }
      if (result) {
        result = (*txn)->Commit();
      } else {
        auto rolled_back = (*txn)->Rollback();
        if (!rolled_back) {
          spdlog::debug("Statistics shutdown rollback failed: {}", rolled_back.error().to_string());
        }
      }
    }
  }

  auto closed = store->Close();
  if (result && !closed) {
    result = utils::MakeUnexpected(closed.error());
  }

  {
    std::unique_lock<std::shared_mutex> lock(unit_mutex_);
    pending_.clear();
  }

  spdlog::debug("Statistics closed: units_written={}", records.size());
  return result;
}

// ============================================================================
// Ingestion and flushing
// ============================================================================

void StatsEngine::Update(const Entry& entry) {
  if (!entry.IsValid()) {
    spdlog::debug("Statistics: dropping invalid entry client='{}' domain='{}' result={}", entry.client, entry.domain,
                  static_cast<int>(entry.result));
    return;
  }
  if (retention_hours_.load(std::memory_order_relaxed) == 0) {
    return;
  }

  const std::string client = utils::NormalizeClientId(entry.client, config_.anonymize_client_ip);

  std::unique_lock<std::shared_mutex> lock(unit_mutex_);
  current_->Add(entry.result, entry.domain, client, entry.processing_time_us);
}

FlushResult StatsEngine::Flush() {
  if (shut_down_.load()) {
    return {false, std::chrono::milliseconds(0)};
  }

  const uint32_t limit = retention_hours_.load();
  if (limit == 0) {
    return {true, kIdleFlushInterval};
  }

  std::lock_guard<std::mutex> flush_lock(flush_mutex_);
  const uint32_t id = unit_id_();

  {
    std::unique_lock<std::shared_mutex> lock(unit_mutex_);
    if (current_->id() == id) {
      if (pending_.empty()) {
        return {true, kIdleFlushInterval};
      }
    } else {
      const uint32_t old_id = current_->id();
      auto existing = pending_.find(old_id);
      if (existing != pending_.end()) {
        // The clock went back and returned to an hour that is still queued
        spdlog::warn("Statistics unit {} rotated twice before being written, keeping the newer counters", old_id);
      }
      pending_[old_id] = std::move(current_);
      current_ = std::make_unique<Unit>(id);
    }
  }

  if (!PersistPending(id, limit)) {
    return {true, kIdleFlushInterval};
  }
  return {true, std::chrono::milliseconds(0)};
}

bool StatsEngine::PersistPending(uint32_t id, uint32_t limit) {
  std::vector<std::pair<uint32_t, UnitRecord>> records;
  {
    std::shared_lock<std::shared_mutex> lock(unit_mutex_);
    records.reserve(pending_.size());
    for (const auto& [unit_id, unit] : pending_) {
      records.emplace_back(unit_id, unit->Serialize());
    }
  }

  auto store = GetStore();
  if (!store) {
    utils::LogStatsError("flush", "Store is closed");
    return false;
  }

  auto txn = store->Begin(true);
  if (!txn) {
    utils::LogStatsError("flush", "Failed to begin transaction: " + txn.error().to_string());
    return false;
  }

  auto abort = [&](const std::string& message) {
    utils::LogStatsError("flush", message);
    auto rolled_back = (*txn)->Rollback();
    if (!rolled_back) {
      spdlog::debug("Statistics flush rollback failed: {}", rolled_back.error().to_string());
    }
    utils::LogStatsFlush(id, records.size(), false);
    return false;
  };

  for (const auto& [unit_id, record] : records) {
    auto encoded = storage::EncodeUnitRecord(record);
    if (!encoded) {
      return abort("Failed to encode unit " + std::to_string(unit_id) + ": " + encoded.error().to_string());
    }
    auto put = (*txn)->Put(IdToKey(unit_id), *encoded);
    if (!put) {
      return abort("Failed to write unit " + std::to_string(unit_id) + ": " + put.error().to_string());
    }
  }

  if (id >= limit) {
    const uint32_t expired_id = id - limit;
    auto deleted = (*txn)->DeleteBucket(IdToKey(expired_id));
    if (!deleted) {
      if (deleted.error().code() != utils::ErrorCode::kNotFound) {
        return abort("Failed to delete unit " + std::to_string(expired_id) + ": " + deleted.error().to_string());
      }
      spdlog::debug("Statistics: unit {} not found for deletion", expired_id);
    }

    // Retention may have shrunk since the older units were written
    auto evicted = DeleteOldUnits(**txn, expired_id + 1);
    if (!evicted) {
      return abort("Eviction walk failed: " + evicted.error().to_string());
    }
  }

  auto committed = (*txn)->Commit();
  if (!committed) {
    return abort("Failed to commit: " + committed.error().to_string());
  }

  {
    std::unique_lock<std::shared_mutex> lock(unit_mutex_);
    for (const auto& entry : records) {
      pending_.erase(entry.first);
    }
  }

  utils::LogStatsFlush(id, records.size(), true);
  return true;
}

void StatsEngine::FlushLoop() {
  while (running_.load()) {
    FlushResult result = Flush();
    if (!result.cont) {
      break;
    }
    if (result.sleep_for.count() > 0) {
      std::unique_lock<std::mutex> lock(loop_mutex_);
      loop_cv_.wait_for(lock, result.sleep_for, [this] { return !running_.load(); });
    }
  }
  spdlog::debug("Statistics flush loop finished");
}

utils::Expected<size_t, utils::Error> StatsEngine::DeleteOldUnits(storage::BucketTransaction& txn, uint32_t first_id) {
  std::vector<std::string> expired;
  auto walked = txn.ForEach([&](std::string_view name) {
    auto id = KeyToId(name);
    if (id && *id >= first_id) {
      return false;
    }
    expired.emplace_back(name);  // Older unit or malformed key
    return true;
  });
  if (!walked) {
    return utils::MakeUnexpected(walked.error());
  }

  size_t deleted = 0;
  for (const auto& name : expired) {
    auto result = txn.DeleteBucket(name);
    if (!result) {
      spdlog::debug("Statistics: failed to delete expired unit: {}", result.error().to_string());
      continue;
    }
    ++deleted;
  }
  return deleted;
}

std::optional<UnitRecord> StatsEngine::LoadUnitRecord(storage::BucketTransaction& txn, uint32_t id,
                                                      utils::Error* read_error) {
  auto value = txn.Get(IdToKey(id));
  if (!value) {
    if (read_error != nullptr) {
      *read_error = value.error();
    }
    return std::nullopt;
  }
  if (!value->has_value()) {
    return std::nullopt;
  }

  auto record = storage::DecodeUnitRecord(**value);
  if (!record) {
    utils::LogStatsError("load_unit", "Unit " + std::to_string(id) + " is unreadable: " + record.error().to_string());
    return std::nullopt;
  }
  return std::move(*record);
}

// ============================================================================
// Administration
// ============================================================================

utils::Expected<void, utils::Error> StatsEngine::SetRetention(uint32_t days) {
  if (!CheckInterval(days)) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "Unsupported interval: " + std::to_string(days)));
  }

  retention_hours_.store(days * kHoursPerDay);
  spdlog::info("Statistics interval set to {} day(s)", days);

  if (days == 0) {
    return Clear();
  }
  EvictExpired(days * kHoursPerDay);
  return {};
}

void StatsEngine::EvictExpired(uint32_t limit) {
  std::lock_guard<std::mutex> flush_lock(flush_mutex_);

  uint32_t id = 0;
  {
    std::shared_lock<std::shared_mutex> lock(unit_mutex_);
    if (!current_) {
      return;
    }
    id = current_->id();
  }
  if (id < limit) {
    return;
  }

  auto store = GetStore();
  if (!store) {
    return;
  }
  auto txn = store->Begin(true);
  if (!txn) {
    utils::LogStatsError("evict", "Failed to begin transaction: " + txn.error().to_string());
    return;
  }

  auto evicted = DeleteOldUnits(**txn, id - limit + 1);
  if (!evicted) {
    utils::LogStatsError("evict", "Eviction walk failed: " + evicted.error().to_string());
    auto rolled_back = (*txn)->Rollback();
    if (!rolled_back) {
      spdlog::debug("Statistics evict rollback failed: {}", rolled_back.error().to_string());
    }
    return;
  }

  auto committed = (*txn)->Commit();
  if (!committed) {
    utils::LogStatsError("evict", "Failed to commit: " + committed.error().to_string());
    return;
  }
  spdlog::debug("Statistics: evicted {} unit(s) after retention change", *evicted);
}

utils::Expected<void, utils::Error> StatsEngine::Clear() {
  std::lock_guard<std::mutex> flush_lock(flush_mutex_);

  std::shared_ptr<storage::BucketStore> old_store;
  {
    std::lock_guard<std::mutex> lock(store_mutex_);
    old_store = std::move(store_);
    store_ = nullptr;
  }

  if (old_store) {
    // Waits for transactions in progress
    auto closed = old_store->Close();
    if (!closed) {
      utils::LogStoreError("clear", config_.file, closed.error().to_string());
    }
  }
  old_store.reset();

  std::error_code ec;
  std::filesystem::remove(config_.file, ec);
  if (ec) {
    utils::LogStoreError("clear", config_.file, "Failed to remove file: " + ec.message());
  }
  std::filesystem::remove(config_.file + "-journal", ec);  // Usually absent

  {
    std::unique_lock<std::shared_mutex> lock(unit_mutex_);
    current_ = std::make_unique<Unit>(unit_id_());
    pending_.clear();
  }

  auto opened = storage::SqliteBucketStore::Open(config_.file);
  if (!opened) {
    utils::LogStoreError("clear", config_.file, opened.error().to_string());
    return utils::MakeUnexpected(opened.error());
  }
  {
    std::lock_guard<std::mutex> lock(store_mutex_);
    store_ = std::move(*opened);
  }

  spdlog::debug("Statistics cleared");
  return {};
}

config::StatsConfig StatsEngine::GetConfig() const {
  config::StatsConfig config = config_;
  config.interval_days = GetRetentionDays();
  return config;
}

void StatsEngine::NotifyConfigModified() const {
  if (config_modified_) {
    config_modified_();
  }
}

// ============================================================================
// Queries
// ============================================================================

std::shared_ptr<storage::BucketStore> StatsEngine::GetStore() const {
  std::lock_guard<std::mutex> lock(store_mutex_);
  return store_;
}

utils::Expected<Window, utils::Error> StatsEngine::LoadWindow(uint32_t limit_hours) {
  auto store = GetStore();
  if (!store) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kStoreClosed, "Statistics store is closed"));
  }

  // A write transaction keeps the flush loop out while the window is read
  auto txn = store->Begin(true);
  if (!txn) {
    return utils::MakeUnexpected(txn.error());
  }

  uint32_t current_id = 0;
  UnitRecord current_record;
  std::map<uint32_t, UnitRecord> queued;
  {
    std::shared_lock<std::shared_mutex> lock(unit_mutex_);
    if (current_) {
      current_id = current_->id();
      current_record = current_->Serialize();
    } else {
      current_id = unit_id_();
    }
    for (const auto& [id, unit] : pending_) {
      queued.emplace(id, unit->Serialize());
    }
  }

  Window window;
  window.first_id = current_id - limit_hours + 1;
  window.records.reserve(limit_hours);

  for (uint32_t id = window.first_id; id != current_id; ++id) {
    auto queued_record = queued.find(id);
    if (queued_record != queued.end()) {
      window.records.push_back(std::move(queued_record->second));
      continue;
    }

    utils::Error read_error;
    auto record = LoadUnitRecord(**txn, id, &read_error);
    if (read_error.code() != utils::ErrorCode::kOk) {
      auto rolled_back = (*txn)->Rollback();
      if (!rolled_back) {
        spdlog::debug("Statistics load rollback failed: {}", rolled_back.error().to_string());
      }
      return utils::MakeUnexpected(read_error);
    }
    window.records.push_back(record ? std::move(*record) : UnitRecord{});
  }

  auto rolled_back = (*txn)->Rollback();
  if (!rolled_back) {
    spdlog::debug("Statistics load rollback failed: {}", rolled_back.error().to_string());
  }

  window.records.push_back(std::move(current_record));

  if (window.records.size() != limit_hours) {
    throw std::logic_error("statistics window has " + std::to_string(window.records.size()) + " units, expected " +
                           std::to_string(limit_hours));
  }
  return window;
}

utils::Expected<Report, utils::Error> StatsEngine::GetReport(std::optional<uint32_t> limit_hours) {
  const uint32_t limit = limit_hours.value_or(retention_hours_.load());
  if (limit == 0) {
    Report report;
    report.time_unit = TimeUnit::kDays;
    return report;
  }

  auto window = LoadWindow(limit);
  if (!window) {
    return utils::MakeUnexpected(window.error());
  }
  return BuildReport(window->records, window->first_id, &ignored_);
}

utils::Expected<std::vector<utils::IpAddress>, utils::Error> StatsEngine::TopClients(size_t limit) {
  std::vector<utils::IpAddress> clients;
  const uint32_t hours = retention_hours_.load();
  if (hours == 0 || limit == 0) {
    return clients;
  }

  auto window = LoadWindow(hours);
  if (!window) {
    return utils::MakeUnexpected(window.error());
  }

  auto top = CollectTopN(window->records, limit,
                         [](const UnitRecord& record) -> const std::vector<NameCount>& { return record.clients; });
  clients.reserve(top.size());
  for (const auto& entry : top) {
    auto address = utils::IpAddress::Parse(entry.name);
    if (!address) {
      continue;
    }
    clients.push_back(*address);
  }
  return clients;
}

}  // namespace dnsstatd::stats

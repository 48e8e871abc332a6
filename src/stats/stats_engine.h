/**
 * @file stats_engine.h
 * @brief Round-robin DNS statistics engine
 *
 * Counts queries into hourly units, persists finished units to a bucket
 * store, evicts units that fall out of the retention window, and answers
 * report queries while ingestion continues.
 *
 * Locking:
 * - unit_mutex_ (shared) guards the current unit and units waiting to be
 *   written. Update() holds it exclusively only to bump in-memory counters.
 * - store_mutex_ guards the store handle, which Clear() swaps out. Callers
 *   copy the handle and release the mutex before starting a transaction.
 * - flush_mutex_ serializes the operations that write units (Flush, Clear,
 *   Shutdown).
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <vector>

#include "config/config.h"
#include "stats/entry.h"
#include "stats/ignore_list.h"
#include "stats/report.h"
#include "stats/unit.h"
#include "stats/unit_id.h"
#include "storage/bucket_store.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/network_utils.h"

namespace dnsstatd::stats {

class RouteRegistrar;

/**
 * @brief Construction parameters for StatsEngine
 */
struct EngineOptions {
  config::StatsConfig config;
  UnitIdGenerator unit_id;               ///< Current bucket id source (defaults to NewUnitId)
  RouteRegistrar* registrar = nullptr;   ///< Receives HTTP routes on Start() (optional, not owned)
  std::function<void()> config_modified;  ///< Called after settings change through the API (optional)
};

/**
 * @brief Outcome of one flush loop step
 */
struct FlushResult {
  bool cont = true;                      ///< Keep running the loop
  std::chrono::milliseconds sleep_for{0};  ///< Pause before the next step
};

/**
 * @brief Contiguous run of records ending with the current unit
 */
struct Window {
  std::vector<UnitRecord> records;  ///< Oldest first
  uint32_t first_id = 0;            ///< Bucket id of records[0]
};

/**
 * @brief Statistics engine
 *
 * Lifecycle: Create() -> Start() -> Shutdown(). Shutdown() is terminal.
 */
class StatsEngine {
 public:
  /**
   * @brief Open the store, evict expired units and restore the current unit
   *
   * An unsupported config.interval_days is replaced with one day. Exceptions
   * thrown during initialization are returned as kInternalError.
   *
   * @param options Engine options
   * @return Engine, or kStoreOpenFailed / kInvalidArgument / kInternalError
   */
  static utils::Expected<std::unique_ptr<StatsEngine>, utils::Error> Create(EngineOptions options);

  ~StatsEngine();

  StatsEngine(const StatsEngine&) = delete;
  StatsEngine& operator=(const StatsEngine&) = delete;
  StatsEngine(StatsEngine&&) = delete;
  StatsEngine& operator=(StatsEngine&&) = delete;

  /**
   * @brief Register HTTP routes and start the flush loop (idempotent)
   */
  void Start();

  /**
   * @brief Count one query
   *
   * Invalid entries are dropped with a debug log. No-op while retention is 0.
   * Never touches the store.
   */
  void Update(const Entry& entry);

  /**
   * @brief Run one flush loop step
   *
   * Moves the current unit to the write queue when the bucket id has
   * advanced, then writes queued units, deletes the unit that fell out of
   * the window and commits. Returns sleep_for = 0 after a rotation so that
   * several elapsed hours are caught up back to back, and one second
   * otherwise or when the write failed (queued units are kept and retried).
   */
  FlushResult Flush();

  /**
   * @brief Stop the loop, write the current unit and close the store
   *
   * Idempotent. Errors come from the final transaction or from closing.
   */
  utils::Expected<void, utils::Error> Shutdown();

  /**
   * @brief Change retention
   *
   * Units that fall outside a shorter retention are deleted right away.
   *
   * @param days One of 0, 1, 7, 30, 90. 0 disables statistics and clears
   *        all stored data.
   * @return kInvalidArgument for other values, or the Clear() error
   */
  utils::Expected<void, utils::Error> SetRetention(uint32_t days);

  /**
   * @brief Current retention in days
   */
  uint32_t GetRetentionDays() const { return retention_hours_.load() / kHoursPerDay; }

  /**
   * @brief Delete all statistics and start from an empty store
   */
  utils::Expected<void, utils::Error> Clear();

  /**
   * @brief Same as Clear()
   */
  utils::Expected<void, utils::Error> Reset() { return Clear(); }

  /**
   * @brief Most active clients in the retention window
   *
   * Client identifiers that are not IP addresses are skipped.
   *
   * @param limit Maximum number of clients
   */
  utils::Expected<std::vector<utils::IpAddress>, utils::Error> TopClients(size_t limit);

  /**
   * @brief Build a report
   *
   * @param limit_hours Window length; defaults to the retention
   * @return Report (all zero with "days" units when the window is empty),
   *         or a store error
   */
  utils::Expected<Report, utils::Error> GetReport(std::optional<uint32_t> limit_hours = std::nullopt);

  /**
   * @brief Check whether queries for host should be counted
   * @return false for hosts on the ignore list
   */
  bool ShouldCount(const std::string& host) const { return !ignored_.Has(host); }

  /**
   * @brief Effective settings (retention reflects SetRetention)
   */
  config::StatsConfig GetConfig() const;

  /**
   * @brief Invoke the config_modified callback, if any
   */
  void NotifyConfigModified() const;

  /**
   * @brief Load limit_hours records ending with the current unit
   *
   * Missing units become zero records. Units waiting to be written are taken
   * from memory.
   *
   * @throws std::logic_error if the window does not have limit_hours records
   */
  utils::Expected<Window, utils::Error> LoadWindow(uint32_t limit_hours);

 private:
  explicit StatsEngine(EngineOptions options);

  utils::Expected<void, utils::Error> Init();

  std::shared_ptr<storage::BucketStore> GetStore() const;

  /**
   * @brief Write queued units and evict expired ones
   * @param id Current bucket id
   * @param limit Retention in hours (non-zero)
   * @return true when committed
   */
  bool PersistPending(uint32_t id, uint32_t limit);

  /**
   * @brief Delete persisted units outside the retention window
   * @param limit Retention in hours (non-zero)
   */
  void EvictExpired(uint32_t limit);

  /**
   * @brief Delete units with id below first_id
   *
   * Walks in key order and stops at the first younger unit.
   *
   * @return Number of units deleted, or a store error from the walk
   */
  static utils::Expected<size_t, utils::Error> DeleteOldUnits(storage::BucketTransaction& txn, uint32_t first_id);

  static std::optional<UnitRecord> LoadUnitRecord(storage::BucketTransaction& txn, uint32_t id,
                                                  utils::Error* read_error);

  void FlushLoop();

  config::StatsConfig config_;
  UnitIdGenerator unit_id_;
  RouteRegistrar* registrar_;
  std::function<void()> config_modified_;
  IgnoreList ignored_;

  std::atomic<uint32_t> retention_hours_{0};

  mutable std::shared_mutex unit_mutex_;
  std::unique_ptr<Unit> current_;
  std::map<uint32_t, std::unique_ptr<Unit>> pending_;  // Rotated out, not yet written

  mutable std::mutex store_mutex_;
  std::shared_ptr<storage::BucketStore> store_;

  std::mutex flush_mutex_;

  std::atomic<bool> running_{false};
  std::atomic<bool> shut_down_{false};
  std::thread flush_thread_;
  std::mutex loop_mutex_;
  std::condition_variable loop_cv_;
};

}  // namespace dnsstatd::stats

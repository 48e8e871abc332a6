/**
 * @file sqlite_bucket_store.h
 * @brief SQLite implementation of BucketStore
 *
 * Buckets live in a single table:
 *   CREATE TABLE buckets(name BLOB PRIMARY KEY, value BLOB NOT NULL) WITHOUT ROWID
 * BLOB primary keys compare with memcmp, so ORDER BY name is byte-wise.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "storage/bucket_store.h"

struct sqlite3;

namespace dnsstatd::storage {

/**
 * @brief Bucket store backed by one SQLite database file
 *
 * One connection is shared by all transactions; a store-wide mutex is held
 * for the lifetime of each transaction.
 */
class SqliteBucketStore : public BucketStore, public std::enable_shared_from_this<SqliteBucketStore> {
 public:
  /**
   * @brief Open (creating if needed) a store file
   *
   * @param path Database file path
   * @return Store, or kStoreOpenFailed
   */
  static utils::Expected<std::shared_ptr<SqliteBucketStore>, utils::Error> Open(const std::string& path);

  ~SqliteBucketStore() override;

  utils::Expected<std::unique_ptr<BucketTransaction>, utils::Error> Begin(bool writable) override;
  utils::Expected<void, utils::Error> Close() override;
  const std::string& GetPath() const override { return path_; }

 private:
  friend class SqliteBucketTransaction;

  explicit SqliteBucketStore(std::string path) : path_(std::move(path)) {}

  /**
   * @brief Execute a statement without results
   * @note Caller must hold mutex_
   */
  utils::Expected<void, utils::Error> Exec(const char* sql, utils::ErrorCode code);

  std::string path_;
  std::mutex mutex_;  // Held by the open transaction
  sqlite3* db_ = nullptr;
};

}  // namespace dnsstatd::storage

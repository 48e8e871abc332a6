/**
 * @file bucket_store.h
 * @brief Transactional bucket key/value storage interface
 *
 * A bucket is a named value. Bucket names are compared byte-wise, and
 * iteration visits them in ascending order.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "utils/error.h"
#include "utils/expected.h"

namespace dnsstatd::storage {

/**
 * @brief One open transaction
 *
 * A transaction that is neither committed nor rolled back is rolled back
 * when destroyed. Operations on a finished transaction fail with
 * kStoreTransactionFailed.
 */
class BucketTransaction {
 public:
  /// Visitor for ForEach; return false to stop the walk
  using Visitor = std::function<bool(std::string_view name)>;

  virtual ~BucketTransaction() = default;

  BucketTransaction(const BucketTransaction&) = delete;
  BucketTransaction& operator=(const BucketTransaction&) = delete;
  BucketTransaction(BucketTransaction&&) = delete;
  BucketTransaction& operator=(BucketTransaction&&) = delete;

  /**
   * @brief Read a bucket
   * @return Value, nullopt if the bucket does not exist, or a store error
   */
  virtual utils::Expected<std::optional<std::string>, utils::Error> Get(std::string_view name) = 0;

  /**
   * @brief Create or replace a bucket (write transactions only)
   */
  virtual utils::Expected<void, utils::Error> Put(std::string_view name, std::string_view value) = 0;

  /**
   * @brief Delete a bucket (write transactions only)
   * @return kNotFound if the bucket does not exist
   */
  virtual utils::Expected<void, utils::Error> DeleteBucket(std::string_view name) = 0;

  /**
   * @brief Visit bucket names in ascending order
   *
   * The visitor must not modify the store.
   */
  virtual utils::Expected<void, utils::Error> ForEach(const Visitor& visitor) = 0;

  virtual utils::Expected<void, utils::Error> Commit() = 0;
  virtual utils::Expected<void, utils::Error> Rollback() = 0;

  virtual bool IsWritable() const = 0;

 protected:
  BucketTransaction() = default;
};

/**
 * @brief Persistent bucket store
 *
 * Transactions are serialized: Begin() blocks while another transaction on
 * the same store is open.
 */
class BucketStore {
 public:
  virtual ~BucketStore() = default;

  BucketStore(const BucketStore&) = delete;
  BucketStore& operator=(const BucketStore&) = delete;
  BucketStore(BucketStore&&) = delete;
  BucketStore& operator=(BucketStore&&) = delete;

  /**
   * @brief Open a transaction
   * @param writable true for a read-write transaction
   * @return Transaction, or kStoreClosed / kStoreTransactionFailed
   */
  virtual utils::Expected<std::unique_ptr<BucketTransaction>, utils::Error> Begin(bool writable) = 0;

  /**
   * @brief Close the store
   *
   * Waits for the open transaction, if any, to finish. Idempotent.
   */
  virtual utils::Expected<void, utils::Error> Close() = 0;

  /**
   * @brief Backing file path
   */
  virtual const std::string& GetPath() const = 0;

 protected:
  BucketStore() = default;
};

}  // namespace dnsstatd::storage

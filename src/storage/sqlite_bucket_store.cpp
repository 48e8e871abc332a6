/**
 * @file sqlite_bucket_store.cpp
 * @brief SQLite implementation of BucketStore
 */

#include "storage/sqlite_bucket_store.h"

#include <sqlite3.h>

#include <filesystem>
#include <system_error>

#include "utils/structured_log.h"

namespace dnsstatd::storage {

using namespace utils;

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS buckets (name BLOB PRIMARY KEY, value BLOB NOT NULL) WITHOUT ROWID";
constexpr const char* kSelectValueSql = "SELECT value FROM buckets WHERE name = ?1";
constexpr const char* kUpsertSql = "INSERT OR REPLACE INTO buckets (name, value) VALUES (?1, ?2)";
constexpr const char* kDeleteSql = "DELETE FROM buckets WHERE name = ?1";
constexpr const char* kSelectNamesSql = "SELECT name FROM buckets ORDER BY name";

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Expected<StatementPtr, Error> Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt);
    return MakeUnexpected(MakeError(ErrorCode::kStoreReadError, sqlite3_errmsg(db), sql));
  }
  return StatementPtr(stmt, &sqlite3_finalize);
}

bool BindBlob(sqlite3_stmt* stmt, int index, std::string_view data) {
  if (data.empty()) {
    return sqlite3_bind_zeroblob(stmt, index, 0) == SQLITE_OK;
  }
  return sqlite3_bind_blob(stmt, index, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT) == SQLITE_OK;
}

std::string ColumnBlob(sqlite3_stmt* stmt, int column) {
  const void* data = sqlite3_column_blob(stmt, column);
  int size = sqlite3_column_bytes(stmt, column);
  if (data == nullptr || size <= 0) {
    return std::string();
  }
  return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

}  // namespace

/**
 * @brief Transaction on a SqliteBucketStore
 *
 * Holds the store mutex until committed, rolled back or destroyed.
 */
class SqliteBucketTransaction : public BucketTransaction {
 public:
  SqliteBucketTransaction(std::shared_ptr<SqliteBucketStore> store, std::unique_lock<std::mutex> lock, bool writable)
      : store_(std::move(store)), lock_(std::move(lock)), writable_(writable) {}

  ~SqliteBucketTransaction() override {
    if (active_) {
      auto result = Rollback();
      if (!result) {
        LogStoreWarning("rollback", result.error().to_string());
      }
    }
  }

  SqliteBucketTransaction(const SqliteBucketTransaction&) = delete;
  SqliteBucketTransaction& operator=(const SqliteBucketTransaction&) = delete;
  SqliteBucketTransaction(SqliteBucketTransaction&&) = delete;
  SqliteBucketTransaction& operator=(SqliteBucketTransaction&&) = delete;

  Expected<std::optional<std::string>, Error> Get(std::string_view name) override {
    auto active = CheckActive(false);
    if (!active) {
      return MakeUnexpected(active.error());
    }

    auto stmt = Prepare(store_->db_, kSelectValueSql);
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }
    if (!BindBlob(stmt->get(), 1, name)) {
      return MakeUnexpected(MakeError(ErrorCode::kStoreReadError, sqlite3_errmsg(store_->db_), "bind name"));
    }

    int step = sqlite3_step(stmt->get());
    if (step == SQLITE_ROW) {
      return std::optional<std::string>(ColumnBlob(stmt->get(), 0));
    }
    if (step == SQLITE_DONE) {
      return std::optional<std::string>();
    }
    return MakeUnexpected(MakeError(ErrorCode::kStoreReadError, sqlite3_errmsg(store_->db_), "get"));
  }

  Expected<void, Error> Put(std::string_view name, std::string_view value) override {
    auto active = CheckActive(true);
    if (!active) {
      return active;
    }

    auto stmt = Prepare(store_->db_, kUpsertSql);
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }
    if (!BindBlob(stmt->get(), 1, name) || !BindBlob(stmt->get(), 2, value)) {
      return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, sqlite3_errmsg(store_->db_), "bind"));
    }
    if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
      return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, sqlite3_errmsg(store_->db_), "put"));
    }
    return {};
  }

  Expected<void, Error> DeleteBucket(std::string_view name) override {
    auto active = CheckActive(true);
    if (!active) {
      return active;
    }

    auto stmt = Prepare(store_->db_, kDeleteSql);
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }
    if (!BindBlob(stmt->get(), 1, name)) {
      return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, sqlite3_errmsg(store_->db_), "bind name"));
    }
    if (sqlite3_step(stmt->get()) != SQLITE_DONE) {
      return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, sqlite3_errmsg(store_->db_), "delete"));
    }
    if (sqlite3_changes(store_->db_) == 0) {
      return MakeUnexpected(MakeError(ErrorCode::kNotFound, "bucket not found"));
    }
    return {};
  }

  Expected<void, Error> ForEach(const Visitor& visitor) override {
    auto active = CheckActive(false);
    if (!active) {
      return active;
    }

    auto stmt = Prepare(store_->db_, kSelectNamesSql);
    if (!stmt) {
      return MakeUnexpected(stmt.error());
    }

    int step = SQLITE_ROW;
    while ((step = sqlite3_step(stmt->get())) == SQLITE_ROW) {
      std::string name = ColumnBlob(stmt->get(), 0);
      if (!visitor(name)) {
        return {};
      }
    }
    if (step != SQLITE_DONE) {
      return MakeUnexpected(MakeError(ErrorCode::kStoreReadError, sqlite3_errmsg(store_->db_), "iterate"));
    }
    return {};
  }

  Expected<void, Error> Commit() override {
    auto active = CheckActive(false);
    if (!active) {
      return active;
    }

    auto result = store_->Exec("COMMIT", ErrorCode::kStoreTransactionFailed);
    if (!result) {
      // A failed COMMIT may leave the transaction open
      if (sqlite3_get_autocommit(store_->db_) == 0) {
        auto rollback = store_->Exec("ROLLBACK", ErrorCode::kStoreTransactionFailed);
        if (!rollback) {
          LogStoreWarning("rollback", rollback.error().to_string());
        }
      }
    }
    Finish();
    return result;
  }

  Expected<void, Error> Rollback() override {
    auto active = CheckActive(false);
    if (!active) {
      return active;
    }

    auto result = store_->Exec("ROLLBACK", ErrorCode::kStoreTransactionFailed);
    Finish();
    return result;
  }

  bool IsWritable() const override { return writable_; }

 private:
  Expected<void, Error> CheckActive(bool needs_write) const {
    if (!active_) {
      return MakeUnexpected(MakeError(ErrorCode::kStoreTransactionFailed, "Transaction already finished"));
    }
    if (needs_write && !writable_) {
      return MakeUnexpected(MakeError(ErrorCode::kStoreTransactionFailed, "Transaction is read-only"));
    }
    return {};
  }

  void Finish() {
    active_ = false;
    lock_.unlock();
  }

  std::shared_ptr<SqliteBucketStore> store_;
  std::unique_lock<std::mutex> lock_;
  bool writable_;
  bool active_ = true;
};

Expected<std::shared_ptr<SqliteBucketStore>, Error> SqliteBucketStore::Open(const std::string& path) {
  std::filesystem::path file_path(path);
  if (file_path.has_parent_path()) {
    std::error_code err;
    std::filesystem::create_directories(file_path.parent_path(), err);
    if (err) {
      return MakeUnexpected(
          MakeError(ErrorCode::kStoreOpenFailed, "Failed to create directory: " + err.message(), path));
    }
  }

  sqlite3* db = nullptr;
  int result = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                               nullptr);
  if (result != SQLITE_OK) {
    std::string message = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(result);
    sqlite3_close(db);
    return MakeUnexpected(MakeError(ErrorCode::kStoreOpenFailed,
                                    "Failed to open statistics database: " + message +
                                        " (check permissions and that the filesystem supports file locking)",
                                    path));
  }

  // NOLINTNEXTLINE(cppcoreguidelines-owning-memory) - Constructor is private
  std::shared_ptr<SqliteBucketStore> store(new SqliteBucketStore(path));
  store->db_ = db;
  sqlite3_busy_timeout(db, kBusyTimeoutMs);

  {
    std::lock_guard<std::mutex> lock(store->mutex_);
    auto created = store->Exec(kCreateTableSql, ErrorCode::kStoreOpenFailed);
    if (!created) {
      LogStoreError("open", path, created.error().message());
      return MakeUnexpected(MakeError(ErrorCode::kStoreOpenFailed,
                                      "Failed to initialize statistics database: " + created.error().message(), path));
    }
  }

  LogStoreInfo("open", path);
  return store;
}

SqliteBucketStore::~SqliteBucketStore() {
  auto result = Close();
  if (!result) {
    LogStoreError("close", path_, result.error().message());
  }
}

Expected<std::unique_ptr<BucketTransaction>, Error> SqliteBucketStore::Begin(bool writable) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kStoreClosed, "Store is closed", path_));
  }

  auto begun = Exec(writable ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED", ErrorCode::kStoreTransactionFailed);
  if (!begun) {
    return MakeUnexpected(begun.error());
  }

  return std::unique_ptr<BucketTransaction>(
      std::make_unique<SqliteBucketTransaction>(shared_from_this(), std::move(lock), writable));
}

Expected<void, Error> SqliteBucketStore::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return {};
  }
  int result = sqlite3_close(db_);
  if (result != SQLITE_OK) {
    return MakeUnexpected(MakeError(ErrorCode::kStoreWriteError, sqlite3_errmsg(db_), path_));
  }
  db_ = nullptr;
  return {};
}

Expected<void, Error> SqliteBucketStore::Exec(const char* sql, ErrorCode code) {
  char* err_msg = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    std::string message = err_msg != nullptr ? err_msg : sqlite3_errmsg(db_);
    sqlite3_free(err_msg);
    return MakeUnexpected(MakeError(code, message, sql));
  }
  return {};
}

}  // namespace dnsstatd::storage

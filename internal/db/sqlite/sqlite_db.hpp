#pragma once

#include <sqlite3.h>

#include <string>

namespace provenance::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, int busy_timeout_ms = kDefaultBusyTimeoutMs);

  static constexpr int kDefaultBusyTimeoutMs = 5000;
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema, transaction control).
  // Lock contention throws db::TransactionConflict, anything else db::BackendError.
  void Exec(const std::string& sql);

  // Create the ledger tables if missing.
  void BootstrapSchema();

 private:
  void Configure(bool wal_mode, int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

// Throws the db exception matching a failed sqlite3 result code.
void ThrowStepError(int rc, const std::string& message);

} // namespace provenance::db::sqlite

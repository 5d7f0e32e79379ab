#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/schema.hpp"

namespace provenance::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode, int busy_timeout_ms) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure(wal_mode, busy_timeout_ms);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    ThrowStepError(rc, msg);
  }
}

void ThrowStepError(int rc, const std::string& message) {
  switch (rc & 0xff) {
    // another connection holds the write lock past the busy timeout
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      throw db::TransactionConflict(message);
    default:
      throw db::BackendError(message);
  }
}

void SqliteDB::BootstrapSchema() {
  for (const auto& statement : sql::SqliteSchema()) {
    Exec(statement);
  }
}

void SqliteDB::Configure(bool wal_mode, int busy_timeout_ms) {
  // WAL lets readers proceed while a ledger call holds the write lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // history rows are the audit trail; keep full durability
  Exec("PRAGMA synchronous=FULL;");

  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, busy_timeout_ms), db_, "busy_timeout");
}

} // namespace provenance::db::sqlite

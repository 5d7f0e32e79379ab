#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace provenance::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& ex) {
      PROVENANCE_LOG_WARN("sqlite rollback failed", {provenance::observability::StringField("path", db_->Path()),
                                                     provenance::observability::StringField("error", ex.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace provenance::db::sqlite

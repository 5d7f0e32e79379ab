#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace provenance::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
  tx_->exec("SET TRANSACTION ISOLATION LEVEL SERIALIZABLE");
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& ex) {
      PROVENANCE_LOG_WARN("postgres rollback failed", {provenance::observability::StringField("error", ex.what())});
    }
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& ex) {
    finished_ = true;
    throw db::TransactionConflict(ex.what());
  } catch (const pqxx::failure& ex) {
    finished_ = true;
    throw db::BackendError(ex.what());
  }
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}

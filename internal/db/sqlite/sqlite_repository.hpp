#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace provenance::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertModel(Transaction&, const model::AIModelRecord&) override;
  std::optional<model::AIModelRecord> GetModel(Transaction&, const std::string&) override;

  Result UpsertVerifier(Transaction&, const model::VerifierRecord&) override;
  std::optional<model::VerifierRecord> GetVerifier(Transaction&, const std::string&) override;

  Result InsertProvenance(Transaction&, const model::ProvenanceRecord&) override;
  std::optional<model::ProvenanceRecord> GetProvenance(Transaction&, uint64_t) override;
  Result UpdateProvenance(Transaction&, const model::ProvenanceRecord&, uint64_t expected_transfer_count) override;

  Result AppendHistory(Transaction&, const model::HistoryRecord&) override;
  std::optional<model::HistoryRecord> GetHistory(Transaction&, uint64_t asset_id, uint64_t transfer_index) override;
  std::vector<model::HistoryRecord> ListHistory(Transaction&, uint64_t asset_id) override;

  Result IncrementCounter(Transaction&, model::Counter counter) override;
  model::CountersRecord GetCounters(Transaction&) override;
  uint64_t LatestHeight(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}

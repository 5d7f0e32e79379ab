#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace provenance::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}

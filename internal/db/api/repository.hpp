#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/ai_model_record.hpp"
#include "internal/db/model/counters_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/provenance_record.hpp"
#include "internal/db/model/verifier_record.hpp"

namespace provenance::db {

/*
  Repository abstraction over the five ledger stores.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - History entries are insert-only: an existing (asset_id, transfer_index)
    key is never overwritten
  - UpdateProvenance is a compare-and-swap on transfer_count
  - Models and provenance records are never deleted
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // AI models
  // ---------------------------------------------------------------------

  virtual Result InsertModel(Transaction&, const model::AIModelRecord&) = 0;

  virtual std::optional<model::AIModelRecord> GetModel(Transaction&, const std::string& model_id) = 0;

  // ---------------------------------------------------------------------
  // Verifier grants
  // ---------------------------------------------------------------------

  virtual Result UpsertVerifier(Transaction&, const model::VerifierRecord&) = 0;

  virtual std::optional<model::VerifierRecord> GetVerifier(Transaction&, const std::string& principal) = 0;

  // ---------------------------------------------------------------------
  // Provenance records
  // ---------------------------------------------------------------------

  virtual Result InsertProvenance(Transaction&, const model::ProvenanceRecord&) = 0;

  virtual std::optional<model::ProvenanceRecord> GetProvenance(Transaction&, uint64_t asset_id) = 0;

  // Fails with Conflict unless the stored transfer_count equals expected_transfer_count.
  virtual Result UpdateProvenance(Transaction&, const model::ProvenanceRecord&, uint64_t expected_transfer_count) = 0;

  // ---------------------------------------------------------------------
  // Ownership history
  // ---------------------------------------------------------------------

  virtual Result AppendHistory(Transaction&, const model::HistoryRecord&) = 0;

  virtual std::optional<model::HistoryRecord> GetHistory(Transaction&, uint64_t asset_id, uint64_t transfer_index) = 0;

  virtual std::vector<model::HistoryRecord> ListHistory(Transaction&, uint64_t asset_id) = 0;

  // ---------------------------------------------------------------------
  // Counters
  // ---------------------------------------------------------------------

  virtual Result IncrementCounter(Transaction&, model::Counter counter) = 0;

  virtual model::CountersRecord GetCounters(Transaction&) = 0;

  // Largest block height stamped on a stored record, 0 for an empty ledger.
  virtual uint64_t LatestHeight(Transaction&) = 0;
};

} // namespace provenance::db

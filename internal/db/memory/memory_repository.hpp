#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace provenance::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::AIModelRecord> models;
    std::unordered_map<std::string, model::VerifierRecord> verifiers;
    std::unordered_map<uint64_t, model::ProvenanceRecord> provenance;

    // ordered so ListHistory walks an asset's entries by transfer index
    std::map<std::pair<uint64_t, uint64_t>, model::HistoryRecord> history;

    model::CountersRecord counters;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace provenance::db::memory

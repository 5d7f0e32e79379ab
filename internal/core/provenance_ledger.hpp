#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/call_context.hpp"
#include "internal/core/history_log.hpp"
#include "internal/core/model_registry.hpp"
#include "internal/core/provenance_store.hpp"
#include "internal/core/transfer_protocol.hpp"
#include "internal/core/verifier_registry.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/clock.hpp"

namespace provenance::core {

/*
  Entry point for every ledger call.

  Per call:
  - argument bounds are checked (InvalidArgument) before any gate
  - the call mutex is held for the whole call (one global critical section)
  - the clock is read once into the CallContext
  - one repository transaction; commit only after every gate passed,
    otherwise the transaction is rolled back by its destructor
*/
class ProvenanceLedger {
 public:
  ProvenanceLedger(std::shared_ptr<provenance::db::Repository> repository, std::string owner, std::shared_ptr<provenance::util::Clock> clock);

  // ------------------------------------------------------------------
  // Mutations
  // ------------------------------------------------------------------

  provenance::db::model::AIModelRecord RegisterModel(const std::string& caller, const std::string& model_id, const std::string& name,
                                                     const std::string& version, int64_t confidence_level);

  provenance::db::model::VerifierRecord AuthorizeVerifier(const std::string& caller, const std::string& verifier);

  provenance::db::model::ProvenanceRecord RegisterAsset(const std::string& caller, uint64_t asset_id, const std::string& model_id,
                                                        int64_t initial_score);

  provenance::db::model::ProvenanceRecord UpdateScore(const std::string& caller, uint64_t asset_id, int64_t new_score);

  TransferResult TransferAsset(const std::string& caller, uint64_t asset_id, const std::string& new_owner, uint64_t price,
                               const std::string& verification_hash);

  // ------------------------------------------------------------------
  // Reads
  // ------------------------------------------------------------------

  bool IsActiveModel(const std::string& model_id);
  bool IsAuthorizedVerifier(const std::string& principal);

  std::optional<provenance::db::model::AIModelRecord>    GetModel(const std::string& model_id);
  std::optional<provenance::db::model::ProvenanceRecord> GetProvenance(uint64_t asset_id);
  std::optional<provenance::db::model::HistoryRecord>    GetHistoryEntry(uint64_t asset_id, uint64_t transfer_index);
  std::vector<provenance::db::model::HistoryRecord>      ListHistory(uint64_t asset_id);
  provenance::db::model::CountersRecord                  GetCounters();

 private:
  template <typename Fn>
  auto Mutate(const std::string& caller, Fn&& fn);

  template <typename Fn>
  auto Read(Fn&& fn);

  std::shared_ptr<provenance::db::Repository> repository_;
  std::shared_ptr<provenance::util::Clock>    clock_;

  std::shared_ptr<ModelRegistry>    models_;
  std::shared_ptr<VerifierRegistry> verifiers_;
  std::shared_ptr<HistoryLog>       history_;
  std::shared_ptr<ProvenanceStore>  store_;
  std::shared_ptr<TransferProtocol> transfers_;

  std::mutex call_mutex_;
};

} // namespace provenance::core

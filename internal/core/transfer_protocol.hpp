#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/core/call_context.hpp"
#include "internal/core/history_log.hpp"
#include "internal/core/model_registry.hpp"
#include "internal/core/provenance_store.hpp"

namespace provenance::core {

struct TransferResult {
  provenance::db::model::ProvenanceRecord record;
  provenance::db::model::HistoryRecord    entry;
};

/*
  Asset transfer. Gates run in order, each one aborts the call:

    1. record exists                      NftNotFound
    2. caller is the current owner        NotAuthorized
    3. record not flagged                 TransferFailed
    4. referenced model still exists      InvalidAiModel
    5. re-scored value >= kMinConfidence  TransferFailed

  Then, in the caller's transaction: one history entry at the old
  transfer_count, and the record moved to the new owner with
  transfer_count + 1 and the re-scored value.
*/
class TransferProtocol {
 public:
  TransferProtocol(std::shared_ptr<ProvenanceStore> store, std::shared_ptr<ModelRegistry> models, std::shared_ptr<HistoryLog> history);

  TransferResult Transfer(provenance::db::Transaction& tx, const CallContext& ctx, uint64_t asset_id, const std::string& new_owner,
                          uint64_t price, const std::string& verification_hash);

 private:
  std::shared_ptr<ProvenanceStore> store_;
  std::shared_ptr<ModelRegistry>   models_;
  std::shared_ptr<HistoryLog>      history_;
};

} // namespace provenance::core

#include "transfer_protocol.hpp"

#include "internal/core/scoring.hpp"
#include "internal/util/errors.hpp"

namespace provenance::core {

TransferProtocol::TransferProtocol(std::shared_ptr<ProvenanceStore> store, std::shared_ptr<ModelRegistry> models,
                                   std::shared_ptr<HistoryLog> history)
    : store_(std::move(store)), models_(std::move(models)), history_(std::move(history)) {
}

TransferResult TransferProtocol::Transfer(provenance::db::Transaction& tx, const CallContext& ctx, uint64_t asset_id,
                                          const std::string& new_owner, uint64_t price, const std::string& verification_hash) {
  const std::string asset = "asset " + std::to_string(asset_id);

  auto current = store_->Find(tx, asset_id);
  if (!current) {
    throw provenance::util::NftNotFound("transfer: " + asset + " not found");
  }

  // ownership, not creatorship
  if (ctx.caller != current->current_owner) {
    throw provenance::util::NotAuthorized("transfer: caller '" + ctx.caller + "' does not own " + asset);
  }

  if (current->flagged) {
    throw provenance::util::TransferFailed("transfer: " + asset + " is flagged");
  }

  // models cannot disappear today; stay defensive anyway
  const auto model = models_->Find(tx, current->ai_model_id);
  if (!model) {
    throw provenance::util::InvalidAiModel("transfer: model '" + current->ai_model_id + "' referenced by " + asset + " is missing");
  }

  const uint32_t updated_score = ComputeTransferScore(model->confidence_level, current->authenticity_score);
  if (updated_score < kMinConfidence) {
    throw provenance::util::TransferFailed("transfer: recomputed score " + std::to_string(updated_score) + " below " +
                                           std::to_string(kMinConfidence) + " for " + asset);
  }

  TransferResult result;
  result.entry.asset_id          = asset_id;
  result.entry.transfer_index    = current->transfer_count;
  result.entry.from_owner        = current->current_owner;
  result.entry.to_owner          = new_owner;
  result.entry.timestamp         = ctx.height;
  result.entry.price             = price;
  result.entry.verification_hash = verification_hash;

  history_->Append(tx, result.entry);

  const uint64_t expected = current->transfer_count;
  result.record                    = *current;
  result.record.current_owner      = new_owner;
  result.record.transfer_count     = expected + 1;
  result.record.authenticity_score = updated_score;
  result.record.last_verified      = ctx.height;

  store_->Replace(tx, result.record, expected);
  return result;
}

} // namespace provenance::core

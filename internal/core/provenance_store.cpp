#include "provenance_store.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/core/scoring.hpp"
#include "internal/db/model/counters_record.hpp"
#include "internal/util/errors.hpp"

namespace provenance::core {

namespace {

std::string AssetLabel(uint64_t asset_id) {
  return "asset " + std::to_string(asset_id);
}

} // namespace

ProvenanceStore::ProvenanceStore(std::shared_ptr<provenance::db::Repository> repository, std::shared_ptr<ModelRegistry> models,
                                 std::shared_ptr<VerifierRegistry> verifiers)
    : repository_(std::move(repository)), models_(std::move(models)), verifiers_(std::move(verifiers)) {
}

provenance::db::model::ProvenanceRecord ProvenanceStore::RegisterAsset(provenance::db::Transaction& tx, const CallContext& ctx,
                                                                       uint64_t asset_id, const std::string& model_id,
                                                                       int64_t initial_score) {
  if (repository_->GetProvenance(tx, asset_id)) {
    throw provenance::util::AlreadyRegistered("register asset: " + AssetLabel(asset_id) + " already registered");
  }

  if (!models_->IsActive(tx, model_id)) {
    throw provenance::util::InvalidAiModel("register asset: model '" + model_id + "' is not an active model");
  }

  if (!IsValidScore(initial_score)) {
    throw provenance::util::InvalidAuthenticityScore("register asset: score " + std::to_string(initial_score) + " outside [0, 100]");
  }

  provenance::db::model::ProvenanceRecord record;
  record.asset_id           = asset_id;
  record.current_owner      = ctx.caller;
  record.creator            = ctx.caller;
  record.ai_model_id        = model_id;
  record.authenticity_score = static_cast<uint32_t>(initial_score);
  record.creation_timestamp = ctx.height;
  record.last_verified      = ctx.height;
  record.transfer_count     = 0;
  record.flagged            = false;

  const auto inserted = repository_->InsertProvenance(tx, record);
  if (inserted.code == provenance::db::ErrorCode::AlreadyExists) {
    throw provenance::util::AlreadyRegistered("register asset: " + AssetLabel(asset_id) + " already registered");
  }
  ThrowIfDbError(inserted, "register asset");
  ThrowIfDbError(repository_->IncrementCounter(tx, provenance::db::model::Counter::TotalAssets), "register asset: counter");

  return record;
}

provenance::db::model::ProvenanceRecord ProvenanceStore::UpdateScore(provenance::db::Transaction& tx, const CallContext& ctx,
                                                                     uint64_t asset_id, int64_t new_score) {
  auto record = repository_->GetProvenance(tx, asset_id);
  if (!record) {
    throw provenance::util::NftNotFound("update score: " + AssetLabel(asset_id) + " not found");
  }

  if (!verifiers_->IsAuthorized(tx, ctx.caller)) {
    throw provenance::util::NotAuthorized("update score: caller '" + ctx.caller + "' is not an authorized verifier");
  }

  if (!IsValidScore(new_score)) {
    throw provenance::util::InvalidAuthenticityScore("update score: score " + std::to_string(new_score) + " outside [0, 100]");
  }

  // partial merge: everything else stays as stored
  const uint64_t expected = record->transfer_count;
  record->authenticity_score = static_cast<uint32_t>(new_score);
  record->last_verified      = ctx.height;

  Replace(tx, *record, expected);
  return *record;
}

std::optional<provenance::db::model::ProvenanceRecord> ProvenanceStore::Find(provenance::db::Transaction& tx, uint64_t asset_id) const {
  return repository_->GetProvenance(tx, asset_id);
}

void ProvenanceStore::Replace(provenance::db::Transaction& tx, const provenance::db::model::ProvenanceRecord& record,
                              uint64_t expected_transfer_count) {
  ThrowIfDbError(repository_->UpdateProvenance(tx, record, expected_transfer_count), "update " + AssetLabel(record.asset_id));
}

} // namespace provenance::core

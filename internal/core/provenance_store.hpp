#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/call_context.hpp"
#include "internal/core/model_registry.hpp"
#include "internal/core/verifier_registry.hpp"
#include "internal/db/api/repository.hpp"

namespace provenance::core {

/*
  Current provenance state of every asset.

  Invariants kept here:
  - one record per asset id, never deleted
  - authenticity_score in [0, 100]
  - creator and creation_timestamp written once
  - every update is a compare-and-swap on transfer_count
*/
class ProvenanceStore {
 public:
  ProvenanceStore(std::shared_ptr<provenance::db::Repository> repository, std::shared_ptr<ModelRegistry> models,
                  std::shared_ptr<VerifierRegistry> verifiers);

  // Gates: AlreadyRegistered, InvalidAiModel, InvalidAuthenticityScore.
  provenance::db::model::ProvenanceRecord RegisterAsset(provenance::db::Transaction& tx, const CallContext& ctx, uint64_t asset_id,
                                                        const std::string& model_id, int64_t initial_score);

  // Gates: NftNotFound, NotAuthorized, InvalidAuthenticityScore.
  // Only authenticity_score and last_verified change.
  provenance::db::model::ProvenanceRecord UpdateScore(provenance::db::Transaction& tx, const CallContext& ctx, uint64_t asset_id,
                                                      int64_t new_score);

  std::optional<provenance::db::model::ProvenanceRecord> Find(provenance::db::Transaction& tx, uint64_t asset_id) const;

  // Writes `record` if the stored transfer_count still equals expected_transfer_count.
  void Replace(provenance::db::Transaction& tx, const provenance::db::model::ProvenanceRecord& record, uint64_t expected_transfer_count);

 private:
  std::shared_ptr<provenance::db::Repository> repository_;
  std::shared_ptr<ModelRegistry>              models_;
  std::shared_ptr<VerifierRegistry>           verifiers_;
};

} // namespace provenance::core

#include "model_registry.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/core/scoring.hpp"
#include "internal/db/model/counters_record.hpp"
#include "internal/util/errors.hpp"

namespace provenance::core {

ModelRegistry::ModelRegistry(std::shared_ptr<provenance::db::Repository> repository, std::string owner)
    : repository_(std::move(repository)), owner_(std::move(owner)) {
}

provenance::db::model::AIModelRecord ModelRegistry::Register(provenance::db::Transaction& tx, const CallContext& ctx,
                                                             const std::string& model_id, const std::string& name,
                                                             const std::string& version, int64_t confidence_level) {
  if (ctx.caller != owner_) {
    throw provenance::util::NotAuthorized("register model: caller '" + ctx.caller + "' is not the registry owner");
  }

  if (repository_->GetModel(tx, model_id)) {
    throw provenance::util::AlreadyRegistered("register model: model '" + model_id + "' already registered");
  }

  if (!IsValidConfidence(confidence_level)) {
    throw provenance::util::InvalidAuthenticityScore("register model: confidence " + std::to_string(confidence_level) +
                                                     " outside [" + std::to_string(kMinConfidence) + ", " +
                                                     std::to_string(kMaxScore) + "]");
  }

  provenance::db::model::AIModelRecord record;
  record.model_id         = model_id;
  record.name             = name;
  record.version          = version;
  record.registered_by    = ctx.caller;
  record.confidence_level = static_cast<uint32_t>(confidence_level);
  record.is_active        = true;

  const auto inserted = repository_->InsertModel(tx, record);
  if (inserted.code == provenance::db::ErrorCode::AlreadyExists) {
    throw provenance::util::AlreadyRegistered("register model: model '" + model_id + "' already registered");
  }
  ThrowIfDbError(inserted, "register model");
  ThrowIfDbError(repository_->IncrementCounter(tx, provenance::db::model::Counter::TotalModels), "register model: counter");

  return record;
}

bool ModelRegistry::IsActive(provenance::db::Transaction& tx, const std::string& model_id) const {
  const auto model = repository_->GetModel(tx, model_id);
  return model && model->is_active;
}

std::optional<provenance::db::model::AIModelRecord> ModelRegistry::Find(provenance::db::Transaction& tx,
                                                                        const std::string& model_id) const {
  return repository_->GetModel(tx, model_id);
}

} // namespace provenance::core

#include "verifier_registry.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace provenance::core {

VerifierRegistry::VerifierRegistry(std::shared_ptr<provenance::db::Repository> repository, std::string owner)
    : repository_(std::move(repository)), owner_(std::move(owner)) {
}

provenance::db::model::VerifierRecord VerifierRegistry::Authorize(provenance::db::Transaction& tx, const CallContext& ctx,
                                                                  const std::string& verifier) {
  if (ctx.caller != owner_) {
    throw provenance::util::NotAuthorized("authorize verifier: caller '" + ctx.caller + "' is not the registry owner");
  }

  provenance::db::model::VerifierRecord record;
  record.principal     = verifier;
  record.is_authorized = true;

  // re-granting overwrites with the same value
  ThrowIfDbError(repository_->UpsertVerifier(tx, record), "authorize verifier");
  return record;
}

bool VerifierRegistry::IsAuthorized(provenance::db::Transaction& tx, const std::string& principal) const {
  const auto grant = repository_->GetVerifier(tx, principal);
  return grant && grant->is_authorized;
}

} // namespace provenance::core

#pragma once

#include <memory>
#include <string>

#include "internal/core/call_context.hpp"
#include "internal/db/api/repository.hpp"

namespace provenance::core {

// Principals allowed to correct authenticity scores. Grants are owner-only
// and cannot be revoked.
class VerifierRegistry {
 public:
  VerifierRegistry(std::shared_ptr<provenance::db::Repository> repository, std::string owner);

  provenance::db::model::VerifierRecord Authorize(provenance::db::Transaction& tx, const CallContext& ctx, const std::string& verifier);

  bool IsAuthorized(provenance::db::Transaction& tx, const std::string& principal) const;

 private:
  std::shared_ptr<provenance::db::Repository> repository_;
  std::string                                 owner_;
};

} // namespace provenance::core

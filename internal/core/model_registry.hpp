#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/call_context.hpp"
#include "internal/db/api/repository.hpp"

namespace provenance::core {

/*
  Trusted AI models.

  Only the registry owner registers models. Models are never deleted and
  nothing here deactivates one.
*/
class ModelRegistry {
 public:
  ModelRegistry(std::shared_ptr<provenance::db::Repository> repository, std::string owner);

  // Gates: NotAuthorized, AlreadyRegistered, InvalidAuthenticityScore.
  provenance::db::model::AIModelRecord Register(provenance::db::Transaction& tx, const CallContext& ctx, const std::string& model_id,
                                                const std::string& name, const std::string& version, int64_t confidence_level);

  // False for unknown ids; never throws for a missing model.
  bool IsActive(provenance::db::Transaction& tx, const std::string& model_id) const;

  std::optional<provenance::db::model::AIModelRecord> Find(provenance::db::Transaction& tx, const std::string& model_id) const;

 private:
  std::shared_ptr<provenance::db::Repository> repository_;
  std::string                                 owner_;
};

} // namespace provenance::core

#include "provenance_ledger.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace provenance::core {

namespace {

constexpr std::size_t kMaxModelIdLength   = 64;
constexpr std::size_t kMaxNameLength      = 128;
constexpr std::size_t kMaxVersionLength   = 32;
constexpr std::size_t kMaxHashLength      = 64;
constexpr std::size_t kMaxPrincipalLength = 128;

void RequireBounded(const char* field, const std::string& value, std::size_t max_length) {
  if (value.size() > max_length) {
    throw provenance::util::InvalidArgument(std::string(field) + " exceeds " + std::to_string(max_length) + " bytes");
  }
}

void RequireIdentifier(const char* field, const std::string& value, std::size_t max_length) {
  if (value.empty()) {
    throw provenance::util::InvalidArgument(std::string(field) + " is required");
  }
  RequireBounded(field, value, max_length);
}

void RequirePrincipal(const char* field, const std::string& value) {
  RequireIdentifier(field, value, kMaxPrincipalLength);
}

} // namespace

ProvenanceLedger::ProvenanceLedger(std::shared_ptr<provenance::db::Repository> repository, std::string owner,
                                   std::shared_ptr<provenance::util::Clock> clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
  if (!repository_) {
    throw std::invalid_argument("provenance ledger requires a repository");
  }
  if (!clock_) {
    throw std::invalid_argument("provenance ledger requires a clock");
  }
  RequirePrincipal("owner", owner);

  models_    = std::make_shared<ModelRegistry>(repository_, owner);
  verifiers_ = std::make_shared<VerifierRegistry>(repository_, owner);
  history_   = std::make_shared<HistoryLog>(repository_);
  store_     = std::make_shared<ProvenanceStore>(repository_, models_, verifiers_);
  transfers_ = std::make_shared<TransferProtocol>(store_, models_, history_);
}

template <typename Fn>
auto ProvenanceLedger::Mutate(const std::string& caller, Fn&& fn) {
  std::lock_guard<std::mutex> lock(call_mutex_);

  const CallContext ctx{caller, clock_->Height()};
  auto              tx = repository_->Begin();

  auto result = fn(*tx, ctx);
  tx->Commit();
  return result;
}

template <typename Fn>
auto ProvenanceLedger::Read(Fn&& fn) {
  std::lock_guard<std::mutex> lock(call_mutex_);

  auto tx     = repository_->Begin();
  auto result = fn(*tx);
  tx->Rollback();
  return result;
}

provenance::db::model::AIModelRecord ProvenanceLedger::RegisterModel(const std::string& caller, const std::string& model_id,
                                                                     const std::string& name, const std::string& version,
                                                                     int64_t confidence_level) {
  RequirePrincipal("caller", caller);
  RequireIdentifier("model_id", model_id, kMaxModelIdLength);
  RequireBounded("name", name, kMaxNameLength);
  RequireBounded("version", version, kMaxVersionLength);

  return Mutate(caller, [&](provenance::db::Transaction& tx, const CallContext& ctx) {
    return models_->Register(tx, ctx, model_id, name, version, confidence_level);
  });
}

provenance::db::model::VerifierRecord ProvenanceLedger::AuthorizeVerifier(const std::string& caller, const std::string& verifier) {
  RequirePrincipal("caller", caller);
  RequirePrincipal("verifier", verifier);

  return Mutate(caller, [&](provenance::db::Transaction& tx, const CallContext& ctx) {
    return verifiers_->Authorize(tx, ctx, verifier);
  });
}

provenance::db::model::ProvenanceRecord ProvenanceLedger::RegisterAsset(const std::string& caller, uint64_t asset_id,
                                                                        const std::string& model_id, int64_t initial_score) {
  RequirePrincipal("caller", caller);
  RequireIdentifier("model_id", model_id, kMaxModelIdLength);

  return Mutate(caller, [&](provenance::db::Transaction& tx, const CallContext& ctx) {
    return store_->RegisterAsset(tx, ctx, asset_id, model_id, initial_score);
  });
}

provenance::db::model::ProvenanceRecord ProvenanceLedger::UpdateScore(const std::string& caller, uint64_t asset_id, int64_t new_score) {
  RequirePrincipal("caller", caller);

  return Mutate(caller, [&](provenance::db::Transaction& tx, const CallContext& ctx) {
    return store_->UpdateScore(tx, ctx, asset_id, new_score);
  });
}

TransferResult ProvenanceLedger::TransferAsset(const std::string& caller, uint64_t asset_id, const std::string& new_owner, uint64_t price,
                                               const std::string& verification_hash) {
  RequirePrincipal("caller", caller);
  RequirePrincipal("new_owner", new_owner);
  RequireBounded("verification_hash", verification_hash, kMaxHashLength);

  return Mutate(caller, [&](provenance::db::Transaction& tx, const CallContext& ctx) {
    return transfers_->Transfer(tx, ctx, asset_id, new_owner, price, verification_hash);
  });
}

bool ProvenanceLedger::IsActiveModel(const std::string& model_id) {
  return Read([&](provenance::db::Transaction& tx) { return models_->IsActive(tx, model_id); });
}

bool ProvenanceLedger::IsAuthorizedVerifier(const std::string& principal) {
  return Read([&](provenance::db::Transaction& tx) { return verifiers_->IsAuthorized(tx, principal); });
}

std::optional<provenance::db::model::AIModelRecord> ProvenanceLedger::GetModel(const std::string& model_id) {
  return Read([&](provenance::db::Transaction& tx) { return models_->Find(tx, model_id); });
}

std::optional<provenance::db::model::ProvenanceRecord> ProvenanceLedger::GetProvenance(uint64_t asset_id) {
  return Read([&](provenance::db::Transaction& tx) { return store_->Find(tx, asset_id); });
}

std::optional<provenance::db::model::HistoryRecord> ProvenanceLedger::GetHistoryEntry(uint64_t asset_id, uint64_t transfer_index) {
  return Read([&](provenance::db::Transaction& tx) { return history_->Get(tx, asset_id, transfer_index); });
}

std::vector<provenance::db::model::HistoryRecord> ProvenanceLedger::ListHistory(uint64_t asset_id) {
  return Read([&](provenance::db::Transaction& tx) { return history_->List(tx, asset_id); });
}

provenance::db::model::CountersRecord ProvenanceLedger::GetCounters() {
  return Read([&](provenance::db::Transaction& tx) { return repository_->GetCounters(tx); });
}

} // namespace provenance::core

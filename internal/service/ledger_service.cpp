#include "ledger_service.hpp"

#include <chrono>
#include <exception>
#include <string_view>

#include "internal/core/provenance_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace provenance::service {

using namespace provenance::ledger::v1;

namespace {

AIModel ToProto(const provenance::db::model::AIModelRecord& record) {
  AIModel model;
  model.set_model_id(record.model_id);
  model.set_name(record.name);
  model.set_version(record.version);
  model.set_registered_by(record.registered_by);
  model.set_confidence_level(record.confidence_level);
  model.set_is_active(record.is_active);
  return model;
}

VerifierGrant ToProto(const provenance::db::model::VerifierRecord& record) {
  VerifierGrant grant;
  grant.set_principal(record.principal);
  grant.set_is_authorized(record.is_authorized);
  return grant;
}

ProvenanceRecord ToProto(const provenance::db::model::ProvenanceRecord& record) {
  ProvenanceRecord out;
  out.set_asset_id(record.asset_id);
  out.set_current_owner(record.current_owner);
  out.set_creator(record.creator);
  out.set_ai_model_id(record.ai_model_id);
  out.set_authenticity_score(record.authenticity_score);
  out.set_creation_timestamp(record.creation_timestamp);
  out.set_last_verified(record.last_verified);
  out.set_transfer_count(record.transfer_count);
  out.set_flagged(record.flagged);
  return out;
}

HistoryEntry ToProto(const provenance::db::model::HistoryRecord& record) {
  HistoryEntry entry;
  entry.set_asset_id(record.asset_id);
  entry.set_transfer_index(record.transfer_index);
  entry.set_from_owner(record.from_owner);
  entry.set_to_owner(record.to_owner);
  entry.set_timestamp(record.timestamp);
  entry.set_price(record.price);
  entry.set_verification_hash(record.verification_hash);
  return entry;
}

template <typename Fn>
auto ObserveCall(std::string_view route, const std::string& caller, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_us = [&] {
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    PROVENANCE_LOG_INFO("ledger call", {provenance::observability::StringField("route", route),
                                        provenance::observability::StringField("caller", caller),
                                        provenance::observability::IntField("elapsed_us", elapsed_us())});
    return result;
  } catch (const provenance::util::StorageError& ex) {
    PROVENANCE_LOG_ERROR("ledger call failed", {provenance::observability::StringField("route", route),
                                                provenance::observability::StringField("caller", caller),
                                                provenance::observability::StringField("code", ErrorCode_Name(ex.code())),
                                                provenance::observability::StringField("error", ex.what())});
    throw;
  } catch (const provenance::util::LedgerError& ex) {
    PROVENANCE_LOG_WARN("ledger call rejected", {provenance::observability::StringField("route", route),
                                                 provenance::observability::StringField("caller", caller),
                                                 provenance::observability::StringField("code", ErrorCode_Name(ex.code())),
                                                 provenance::observability::StringField("error", ex.what())});
    throw;
  } catch (const std::exception& ex) {
    PROVENANCE_LOG_ERROR("ledger call failed", {provenance::observability::StringField("route", route),
                                                provenance::observability::StringField("caller", caller),
                                                provenance::observability::StringField("code", ErrorCode_Name(provenance::util::ToErrorCode(ex))),
                                                provenance::observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterModelResponse LedgerService::RegisterModel(const std::string& caller, const RegisterModelRequest& req) {
  return ObserveCall("LedgerService.RegisterModel", caller, [&] {
    RegisterModelResponse resp;
    *resp.mutable_model() = ToProto(ctx_.ledger->RegisterModel(caller, req.model_id(), req.name(), req.version(), req.confidence_level()));
    return resp;
  });
}

AuthorizeVerifierResponse LedgerService::AuthorizeVerifier(const std::string& caller, const AuthorizeVerifierRequest& req) {
  return ObserveCall("LedgerService.AuthorizeVerifier", caller, [&] {
    AuthorizeVerifierResponse resp;
    *resp.mutable_grant() = ToProto(ctx_.ledger->AuthorizeVerifier(caller, req.verifier()));
    return resp;
  });
}

RegisterAssetResponse LedgerService::RegisterAsset(const std::string& caller, const RegisterAssetRequest& req) {
  return ObserveCall("LedgerService.RegisterAsset", caller, [&] {
    RegisterAssetResponse resp;
    *resp.mutable_record() = ToProto(ctx_.ledger->RegisterAsset(caller, req.asset_id(), req.model_id(), req.initial_score()));
    return resp;
  });
}

UpdateScoreResponse LedgerService::UpdateScore(const std::string& caller, const UpdateScoreRequest& req) {
  return ObserveCall("LedgerService.UpdateScore", caller, [&] {
    UpdateScoreResponse resp;
    *resp.mutable_record() = ToProto(ctx_.ledger->UpdateScore(caller, req.asset_id(), req.new_score()));
    return resp;
  });
}

TransferAssetResponse LedgerService::TransferAsset(const std::string& caller, const TransferAssetRequest& req) {
  return ObserveCall("LedgerService.TransferAsset", caller, [&] {
    const auto result = ctx_.ledger->TransferAsset(caller, req.asset_id(), req.new_owner(), req.price(), req.verification_hash());

    TransferAssetResponse resp;
    *resp.mutable_record() = ToProto(result.record);
    *resp.mutable_entry()  = ToProto(result.entry);
    return resp;
  });
}

GetModelResponse LedgerService::GetModel(const GetModelRequest& req) {
  return ObserveCall("LedgerService.GetModel", "", [&] {
    const auto model = ctx_.ledger->GetModel(req.model_id());
    if (!model) {
      throw provenance::util::InvalidAiModel("model '" + req.model_id() + "' not found");
    }

    GetModelResponse resp;
    *resp.mutable_model() = ToProto(*model);
    return resp;
  });
}

GetProvenanceResponse LedgerService::GetProvenance(const GetProvenanceRequest& req) {
  return ObserveCall("LedgerService.GetProvenance", "", [&] {
    const auto record = ctx_.ledger->GetProvenance(req.asset_id());
    if (!record) {
      throw provenance::util::NftNotFound("asset " + std::to_string(req.asset_id()) + " not found");
    }

    GetProvenanceResponse resp;
    *resp.mutable_record() = ToProto(*record);
    return resp;
  });
}

GetHistoryResponse LedgerService::GetHistory(const GetHistoryRequest& req) {
  return ObserveCall("LedgerService.GetHistory", "", [&] {
    GetHistoryResponse resp;
    if (req.has_transfer_index()) {
      if (const auto entry = ctx_.ledger->GetHistoryEntry(req.asset_id(), req.transfer_index())) {
        *resp.add_entries() = ToProto(*entry);
      }
      return resp;
    }

    for (const auto& entry : ctx_.ledger->ListHistory(req.asset_id())) {
      *resp.add_entries() = ToProto(entry);
    }
    return resp;
  });
}

GetCountersResponse LedgerService::GetCounters(const GetCountersRequest&) {
  return ObserveCall("LedgerService.GetCounters", "", [&] {
    const auto counters = ctx_.ledger->GetCounters();

    GetCountersResponse resp;
    resp.mutable_counters()->set_total_assets(counters.total_assets);
    resp.mutable_counters()->set_total_models(counters.total_models);
    return resp;
  });
}

BoolResponse LedgerService::IsActiveModel(const IsActiveModelRequest& req) {
  return ObserveCall("LedgerService.IsActiveModel", "", [&] {
    BoolResponse resp;
    resp.set_value(ctx_.ledger->IsActiveModel(req.model_id()));
    return resp;
  });
}

BoolResponse LedgerService::IsAuthorizedVerifier(const IsAuthorizedVerifierRequest& req) {
  return ObserveCall("LedgerService.IsAuthorizedVerifier", "", [&] {
    BoolResponse resp;
    resp.set_value(ctx_.ledger->IsAuthorizedVerifier(req.principal()));
    return resp;
  });
}

}

#pragma once

#include <string>

#include "provenance/ledger/v1.hpp"
#include "service_context.hpp"

namespace provenance::service {

/*
  Protobuf surface of the ledger.

  The caller principal is supplied by the host next to each request.
  Failures are thrown as util::LedgerError (or StorageError); hosts map
  them with util::ToErrorCode.
*/
class LedgerService {
public:
  explicit LedgerService(ServiceContext ctx);

  provenance::ledger::v1::RegisterModelResponse
  RegisterModel(const std::string& caller, const provenance::ledger::v1::RegisterModelRequest& req);

  provenance::ledger::v1::AuthorizeVerifierResponse
  AuthorizeVerifier(const std::string& caller, const provenance::ledger::v1::AuthorizeVerifierRequest& req);

  provenance::ledger::v1::RegisterAssetResponse
  RegisterAsset(const std::string& caller, const provenance::ledger::v1::RegisterAssetRequest& req);

  provenance::ledger::v1::UpdateScoreResponse
  UpdateScore(const std::string& caller, const provenance::ledger::v1::UpdateScoreRequest& req);

  provenance::ledger::v1::TransferAssetResponse
  TransferAsset(const std::string& caller, const provenance::ledger::v1::TransferAssetRequest& req);

  provenance::ledger::v1::GetModelResponse
  GetModel(const provenance::ledger::v1::GetModelRequest& req);

  provenance::ledger::v1::GetProvenanceResponse
  GetProvenance(const provenance::ledger::v1::GetProvenanceRequest& req);

  provenance::ledger::v1::GetHistoryResponse
  GetHistory(const provenance::ledger::v1::GetHistoryRequest& req);

  provenance::ledger::v1::GetCountersResponse
  GetCounters(const provenance::ledger::v1::GetCountersRequest& req);

  provenance::ledger::v1::BoolResponse
  IsActiveModel(const provenance::ledger::v1::IsActiveModelRequest& req);

  provenance::ledger::v1::BoolResponse
  IsAuthorizedVerifier(const provenance::ledger::v1::IsAuthorizedVerifierRequest& req);

private:
  ServiceContext ctx_;
};

}

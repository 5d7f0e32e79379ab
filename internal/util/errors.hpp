#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "provenance/ledger/v1/types.pb.h"

namespace provenance::util {

/*
  Central error types.

  Every ledger rejection is one of these. Hosts translate them to
  provenance::ledger::v1::ErrorCode with ToErrorCode().
*/

using ErrorCode = provenance::ledger::v1::ErrorCode;

class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const {
    return code_;
  }

 private:
  ErrorCode code_;
};

class NotAuthorized : public LedgerError {
 public:
  explicit NotAuthorized(const std::string& msg) : LedgerError(provenance::ledger::v1::ERROR_CODE_NOT_AUTHORIZED, msg) {
  }
};

class NftNotFound : public LedgerError {
 public:
  explicit NftNotFound(const std::string& msg) : LedgerError(provenance::ledger::v1::ERROR_CODE_NFT_NOT_FOUND, msg) {
  }
};

class AlreadyRegistered : public LedgerError {
 public:
  explicit AlreadyRegistered(const std::string& msg) : LedgerError(provenance::ledger::v1::ERROR_CODE_ALREADY_REGISTERED, msg) {
  }
};

class InvalidAuthenticityScore : public LedgerError {
 public:
  explicit InvalidAuthenticityScore(const std::string& msg)
      : LedgerError(provenance::ledger::v1::ERROR_CODE_INVALID_AUTHENTICITY_SCORE, msg) {
  }
};

class TransferFailed : public LedgerError {
 public:
  explicit TransferFailed(const std::string& msg) : LedgerError(provenance::ledger::v1::ERROR_CODE_TRANSFER_FAILED, msg) {
  }
};

class InvalidAiModel : public LedgerError {
 public:
  explicit InvalidAiModel(const std::string& msg) : LedgerError(provenance::ledger::v1::ERROR_CODE_INVALID_AI_MODEL, msg) {
  }
};

// Reserved. Nothing in the ledger raises it yet.
class ProvenanceNotFound : public LedgerError {
 public:
  explicit ProvenanceNotFound(const std::string& msg) : LedgerError(provenance::ledger::v1::ERROR_CODE_PROVENANCE_NOT_FOUND, msg) {
  }
};

class InvalidArgument : public LedgerError {
 public:
  explicit InvalidArgument(const std::string& msg) : LedgerError(provenance::ledger::v1::ERROR_CODE_INVALID_ARGUMENT, msg) {
  }
};

// Repository failure (busy, conflict, io). The call had no effect.
class StorageError : public LedgerError {
 public:
  explicit StorageError(const std::string& msg) : LedgerError(provenance::ledger::v1::ERROR_CODE_STORAGE, msg) {
  }
};

ErrorCode ToErrorCode(const std::exception& e);

provenance::ledger::v1::Status ToStatus(const std::exception& e);

} // namespace provenance::util

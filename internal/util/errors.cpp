#include "internal/util/errors.hpp"

#include "internal/db/api/transaction.hpp"

namespace provenance::util {

ErrorCode ToErrorCode(const std::exception& e) {
  if (const auto* ledger_error = dynamic_cast<const LedgerError*>(&e)) {
    return ledger_error->code();
  }
  if (dynamic_cast<const provenance::db::BackendError*>(&e)) {
    return provenance::ledger::v1::ERROR_CODE_STORAGE;
  }
  return provenance::ledger::v1::ERROR_CODE_INTERNAL;
}

provenance::ledger::v1::Status ToStatus(const std::exception& e) {
  provenance::ledger::v1::Status status;
  status.set_code(ToErrorCode(e));
  status.set_message(e.what());
  return status;
}

} // namespace provenance::util

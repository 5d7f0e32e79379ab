#pragma once

#include <string>
#include <utility>

namespace provenance::db {

/*
  Backend-neutral result codes for repository writes.

  sqlite/pqxx errors are translated into these by each backend;
  the ledger core never sees driver error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict, // compare-and-swap on transfer_count lost
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

const char* ToString(ErrorCode code);

} // namespace provenance::db

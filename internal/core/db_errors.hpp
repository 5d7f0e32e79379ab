#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace provenance::core {

// Repository results reaching this point are storage failures: every
// expected outcome (missing row, duplicate key) is checked by a gate first.
inline void ThrowIfDbError(const provenance::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  std::string message = context + ": " + provenance::db::ToString(result.code);
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  throw provenance::util::StorageError(message);
}

} // namespace provenance::core

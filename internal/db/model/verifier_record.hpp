#pragma once

#include <string>

namespace provenance::db::model {

struct VerifierRecord {
  std::string principal;
  bool        is_authorized = false;
};

} // namespace provenance::db::model

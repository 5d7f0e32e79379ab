#pragma once

#include <cstdint>
#include <string>

namespace provenance::db::model {

/*
  Registered AI attribution model.

  Identity (model_id) is caller supplied and immutable.
  Rows are never deleted.
*/

struct AIModelRecord {
  std::string model_id;
  std::string name;
  std::string version;
  std::string registered_by;

  uint32_t confidence_level = 0;
  bool     is_active        = false;
};

} // namespace provenance::db::model

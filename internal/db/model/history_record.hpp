#pragma once

#include <cstdint>
#include <string>

namespace provenance::db::model {

/*
  One completed transfer. Keyed by (asset_id, transfer_index).

  verification_hash is opaque caller data; it is stored, never checked.
*/

struct HistoryRecord {
  uint64_t asset_id       = 0;
  uint64_t transfer_index = 0;

  std::string from_owner;
  std::string to_owner;

  uint64_t timestamp = 0; // block height
  uint64_t price     = 0;

  std::string verification_hash;
};

} // namespace provenance::db::model

#pragma once

#include <cstdint>
#include <string>

namespace provenance::db::model {

/*
  Current provenance state of one asset.

  IMPORTANT:
  - creator and creation_timestamp are write-once.
  - transfer_count is both the number of completed transfers and the next
    free history index; it is the compare-and-swap key for updates.
  - Timestamps are block heights.
*/

struct ProvenanceRecord {
  uint64_t asset_id = 0;

  std::string current_owner;
  std::string creator;
  std::string ai_model_id;

  uint32_t authenticity_score = 0;

  uint64_t creation_timestamp = 0;
  uint64_t last_verified      = 0;

  uint64_t transfer_count = 0;
  bool     flagged        = false;
};

} // namespace provenance::db::model

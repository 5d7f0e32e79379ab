#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace provenance::core {

/*
  Append-only ownership history, keyed by (asset_id, transfer_index).

  A key is consumed exactly once, when the owning record's transfer_count
  moves past it. Entries are never rewritten or removed.
*/
class HistoryLog {
 public:
  explicit HistoryLog(std::shared_ptr<provenance::db::Repository> repository);

  // Throws StorageError if the key is already taken.
  void Append(provenance::db::Transaction& tx, const provenance::db::model::HistoryRecord& entry);

  std::optional<provenance::db::model::HistoryRecord> Get(provenance::db::Transaction& tx, uint64_t asset_id, uint64_t transfer_index) const;

  // Ordered by transfer_index.
  std::vector<provenance::db::model::HistoryRecord> List(provenance::db::Transaction& tx, uint64_t asset_id) const;

 private:
  std::shared_ptr<provenance::db::Repository> repository_;
};

} // namespace provenance::core

#include "history_log.hpp"

#include <string>

#include "internal/core/db_errors.hpp"

namespace provenance::core {

HistoryLog::HistoryLog(std::shared_ptr<provenance::db::Repository> repository) : repository_(std::move(repository)) {
}

void HistoryLog::Append(provenance::db::Transaction& tx, const provenance::db::model::HistoryRecord& entry) {
  ThrowIfDbError(repository_->AppendHistory(tx, entry),
                 "append history[" + std::to_string(entry.asset_id) + "," + std::to_string(entry.transfer_index) + "]");
}

std::optional<provenance::db::model::HistoryRecord> HistoryLog::Get(provenance::db::Transaction& tx, uint64_t asset_id,
                                                                    uint64_t transfer_index) const {
  return repository_->GetHistory(tx, asset_id, transfer_index);
}

std::vector<provenance::db::model::HistoryRecord> HistoryLog::List(provenance::db::Transaction& tx, uint64_t asset_id) const {
  return repository_->ListHistory(tx, asset_id);
}

} // namespace provenance::core

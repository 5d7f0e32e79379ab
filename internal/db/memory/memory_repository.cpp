#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace provenance::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// AI models
// ------------------------------------------------------------------

Result MemoryRepository::InsertModel(Transaction& t, const model::AIModelRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.models.contains(r.model_id)) return Result::Err(ErrorCode::AlreadyExists, "model " + r.model_id);
  s.models[r.model_id] = r;
  return Result::Ok();
}

std::optional<model::AIModelRecord> MemoryRepository::GetModel(Transaction& t, const std::string& model_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.models.find(model_id);
  if (it == s.models.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Verifiers
// ------------------------------------------------------------------

Result MemoryRepository::UpsertVerifier(Transaction& t, const model::VerifierRecord& r) {
  TX(t).Mutable().verifiers[r.principal] = r;
  return Result::Ok();
}

std::optional<model::VerifierRecord> MemoryRepository::GetVerifier(Transaction& t, const std::string& principal) {
  const auto& s  = TX(t).View();
  const auto  it = s.verifiers.find(principal);
  if (it == s.verifiers.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Provenance
// ------------------------------------------------------------------

Result MemoryRepository::InsertProvenance(Transaction& t, const model::ProvenanceRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.provenance.contains(r.asset_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "asset " + std::to_string(r.asset_id));
  }
  s.provenance[r.asset_id] = r;
  return Result::Ok();
}

std::optional<model::ProvenanceRecord> MemoryRepository::GetProvenance(Transaction& t, uint64_t asset_id) {
  const auto& s  = TX(t).View();
  const auto  it = s.provenance.find(asset_id);
  if (it == s.provenance.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateProvenance(Transaction& t, const model::ProvenanceRecord& r, uint64_t expected_transfer_count) {
  auto& s  = TX(t).Mutable();
  auto  it = s.provenance.find(r.asset_id);
  if (it == s.provenance.end()) return Result::Err(ErrorCode::NotFound, "asset " + std::to_string(r.asset_id));
  if (it->second.transfer_count != expected_transfer_count) {
    return Result::Err(ErrorCode::Conflict, "transfer_count changed for asset " + std::to_string(r.asset_id));
  }
  // creator and creation_timestamp are write-once
  auto updated               = r;
  updated.creator            = it->second.creator;
  updated.creation_timestamp = it->second.creation_timestamp;
  it->second                 = std::move(updated);
  return Result::Ok();
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result MemoryRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = std::make_pair(r.asset_id, r.transfer_index);
  if (s.history.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists,
                       "history entry " + std::to_string(r.asset_id) + "#" + std::to_string(r.transfer_index));
  }
  s.history.emplace(key, r);
  return Result::Ok();
}

std::optional<model::HistoryRecord> MemoryRepository::GetHistory(Transaction& t, uint64_t asset_id, uint64_t transfer_index) {
  const auto& s  = TX(t).View();
  const auto  it = s.history.find({asset_id, transfer_index});
  if (it == s.history.end()) return std::nullopt;
  return it->second;
}

std::vector<model::HistoryRecord> MemoryRepository::ListHistory(Transaction& t, uint64_t asset_id) {
  const auto&                       s = TX(t).View();
  std::vector<model::HistoryRecord> out;
  for (auto it = s.history.lower_bound({asset_id, 0}); it != s.history.end() && it->first.first == asset_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

Result MemoryRepository::IncrementCounter(Transaction& t, model::Counter counter) {
  auto& c = TX(t).Mutable().counters;
  if (counter == model::Counter::TotalAssets) {
    c.total_assets++;
  } else {
    c.total_models++;
  }
  return Result::Ok();
}

model::CountersRecord MemoryRepository::GetCounters(Transaction& t) {
  return TX(t).View().counters;
}

uint64_t MemoryRepository::LatestHeight(Transaction& t) {
  const auto& s      = TX(t).View();
  uint64_t    height = 0;
  for (const auto& [asset_id, record] : s.provenance) {
    height = std::max({height, record.creation_timestamp, record.last_verified});
  }
  for (const auto& [key, entry] : s.history) {
    height = std::max(height, entry.timestamp);
  }
  return height;
}

} // namespace provenance::db::memory

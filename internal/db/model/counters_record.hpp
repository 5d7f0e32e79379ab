#pragma once

#include <cstdint>

namespace provenance::db::model {

enum class Counter {
  TotalAssets,
  TotalModels,
};

// Stored under these names in the ledger_counters table.
inline const char* CounterName(Counter counter) {
  return counter == Counter::TotalAssets ? "total_assets" : "total_models";
}

struct CountersRecord {
  uint64_t total_assets = 0;
  uint64_t total_models = 0;
};

} // namespace provenance::db::model

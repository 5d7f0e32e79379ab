#pragma once

#include <string>
#include <vector>

namespace provenance::db::sql {

/*
  Ledger schema, one statement per entry.

  No foreign key from provenance.ai_model_id to ai_models: the transfer
  path re-checks the model itself, and all backends must accept the
  same records.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS ai_models (model_id TEXT PRIMARY KEY, name TEXT NOT NULL, version TEXT NOT NULL, registered_by TEXT NOT NULL, "
      "confidence_level INTEGER NOT NULL CHECK (confidence_level BETWEEN 0 AND 100), is_active INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS verifiers (principal TEXT PRIMARY KEY, is_authorized INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS provenance (asset_id INTEGER PRIMARY KEY, current_owner TEXT NOT NULL, creator TEXT NOT NULL, "
      "ai_model_id TEXT NOT NULL, authenticity_score INTEGER NOT NULL CHECK (authenticity_score BETWEEN 0 AND 100), "
      "creation_timestamp INTEGER NOT NULL, last_verified INTEGER NOT NULL, transfer_count INTEGER NOT NULL, flagged INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS ownership_history (asset_id INTEGER NOT NULL, transfer_index INTEGER NOT NULL, from_owner TEXT NOT NULL, "
      "to_owner TEXT NOT NULL, timestamp INTEGER NOT NULL, price INTEGER NOT NULL, verification_hash TEXT NOT NULL, "
      "PRIMARY KEY (asset_id, transfer_index));",
      "CREATE TABLE IF NOT EXISTS ledger_counters (name TEXT PRIMARY KEY, value INTEGER NOT NULL);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS ai_models (model_id TEXT PRIMARY KEY, name TEXT NOT NULL, version TEXT NOT NULL, registered_by TEXT NOT NULL, "
      "confidence_level SMALLINT NOT NULL CHECK (confidence_level BETWEEN 0 AND 100), is_active BOOLEAN NOT NULL);",
      "CREATE TABLE IF NOT EXISTS verifiers (principal TEXT PRIMARY KEY, is_authorized BOOLEAN NOT NULL);",
      "CREATE TABLE IF NOT EXISTS provenance (asset_id BIGINT PRIMARY KEY, current_owner TEXT NOT NULL, creator TEXT NOT NULL, "
      "ai_model_id TEXT NOT NULL, authenticity_score SMALLINT NOT NULL CHECK (authenticity_score BETWEEN 0 AND 100), "
      "creation_timestamp BIGINT NOT NULL, last_verified BIGINT NOT NULL, transfer_count BIGINT NOT NULL, flagged BOOLEAN NOT NULL);",
      "CREATE TABLE IF NOT EXISTS ownership_history (asset_id BIGINT NOT NULL, transfer_index BIGINT NOT NULL, from_owner TEXT NOT NULL, "
      "to_owner TEXT NOT NULL, timestamp BIGINT NOT NULL, price BIGINT NOT NULL, verification_hash TEXT NOT NULL, "
      "PRIMARY KEY (asset_id, transfer_index));",
      "CREATE TABLE IF NOT EXISTS ledger_counters (name TEXT PRIMARY KEY, value BIGINT NOT NULL);"};
  return kSchema;
}

} // namespace provenance::db::sql

#include "pg_repository.hpp"

namespace provenance::db::postgres {

namespace {

// BIGINT columns are signed; asset ids and prices round-trip through int64.
int64_t ToDb(uint64_t v) {
  return static_cast<int64_t>(v);
}

uint64_t FromDb(const pqxx::field& f) {
  return static_cast<uint64_t>(f.as<int64_t>());
}

model::ProvenanceRecord ReadProvenance(const pqxx::row& row) {
  model::ProvenanceRecord r;
  r.asset_id           = FromDb(row[0]);
  r.current_owner      = row[1].c_str();
  r.creator            = row[2].c_str();
  r.ai_model_id        = row[3].c_str();
  r.authenticity_score = static_cast<uint32_t>(row[4].as<int>());
  r.creation_timestamp = FromDb(row[5]);
  r.last_verified      = FromDb(row[6]);
  r.transfer_count     = FromDb(row[7]);
  r.flagged            = row[8].as<bool>();
  return r;
}

model::HistoryRecord ReadHistory(const pqxx::row& row) {
  model::HistoryRecord r;
  r.asset_id          = FromDb(row[0]);
  r.transfer_index    = FromDb(row[1]);
  r.from_owner        = row[2].c_str();
  r.to_owner          = row[3].c_str();
  r.timestamp         = FromDb(row[4]);
  r.price             = FromDb(row[5]);
  r.verification_hash = row[6].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertModel(Transaction& t, const model::AIModelRecord& r) {
  try {
    // ON CONFLICT keeps the transaction usable after a duplicate key
    auto res = TX(t).Work().exec_prepared("insert_model", r.model_id, r.name, r.version, r.registered_by,
                                          static_cast<int>(r.confidence_level), r.is_active);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "model " + r.model_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AIModelRecord> PgRepository::GetModel(Transaction& t, const std::string& model_id) {
  auto res = TX(t).Work().exec_prepared("get_model", model_id);
  if (res.empty()) return std::nullopt;

  model::AIModelRecord r;
  r.model_id         = res[0][0].c_str();
  r.name             = res[0][1].c_str();
  r.version          = res[0][2].c_str();
  r.registered_by    = res[0][3].c_str();
  r.confidence_level = static_cast<uint32_t>(res[0][4].as<int>());
  r.is_active        = res[0][5].as<bool>();
  return r;
}

Result PgRepository::UpsertVerifier(Transaction& t, const model::VerifierRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO verifiers(principal,is_authorized) VALUES($1,$2) "
        "ON CONFLICT(principal) DO UPDATE SET is_authorized=EXCLUDED.is_authorized;",
        r.principal, r.is_authorized);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::VerifierRecord> PgRepository::GetVerifier(Transaction& t, const std::string& principal) {
  auto res = TX(t).Work().exec_params("SELECT principal,is_authorized FROM verifiers WHERE principal=$1;", principal);
  if (res.empty()) return std::nullopt;

  model::VerifierRecord r;
  r.principal     = res[0][0].c_str();
  r.is_authorized = res[0][1].as<bool>();
  return r;
}

Result PgRepository::InsertProvenance(Transaction& t, const model::ProvenanceRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO provenance(asset_id,current_owner,creator,ai_model_id,authenticity_score,"
        "creation_timestamp,last_verified,transfer_count,flagged) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) "
        "ON CONFLICT (asset_id) DO NOTHING;",
        ToDb(r.asset_id), r.current_owner, r.creator, r.ai_model_id, static_cast<int>(r.authenticity_score),
        ToDb(r.creation_timestamp), ToDb(r.last_verified), ToDb(r.transfer_count), r.flagged);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, "asset " + std::to_string(r.asset_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProvenanceRecord> PgRepository::GetProvenance(Transaction& t, uint64_t asset_id) {
  auto res = TX(t).Work().exec_prepared("get_provenance", ToDb(asset_id));
  if (res.empty()) return std::nullopt;
  return ReadProvenance(res[0]);
}

Result PgRepository::UpdateProvenance(Transaction& t, const model::ProvenanceRecord& r, uint64_t expected_transfer_count) {
  try {
    auto res = TX(t).Work().exec_prepared("cas_provenance", ToDb(r.asset_id), r.current_owner, r.ai_model_id,
                                          static_cast<int>(r.authenticity_score), ToDb(r.last_verified),
                                          ToDb(r.transfer_count), r.flagged, ToDb(expected_transfer_count));
    if (res.affected_rows() == 0) {
      if (!GetProvenance(t, r.asset_id).has_value()) {
        return Result::Err(ErrorCode::NotFound, "asset " + std::to_string(r.asset_id));
      }
      return Result::Err(ErrorCode::Conflict, "transfer_count changed for asset " + std::to_string(r.asset_id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("append_history", ToDb(r.asset_id), ToDb(r.transfer_index), r.from_owner,
                                          r.to_owner, ToDb(r.timestamp), ToDb(r.price), r.verification_hash);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::AlreadyExists,
                         "history " + std::to_string(r.asset_id) + "/" + std::to_string(r.transfer_index));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::HistoryRecord> PgRepository::GetHistory(Transaction& t, uint64_t asset_id, uint64_t transfer_index) {
  auto res = TX(t).Work().exec_params(
      "SELECT asset_id,transfer_index,from_owner,to_owner,timestamp,price,verification_hash "
      "FROM ownership_history WHERE asset_id=$1 AND transfer_index=$2;",
      ToDb(asset_id), ToDb(transfer_index));
  if (res.empty()) return std::nullopt;
  return ReadHistory(res[0]);
}

std::vector<model::HistoryRecord> PgRepository::ListHistory(Transaction& t, uint64_t asset_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT asset_id,transfer_index,from_owner,to_owner,timestamp,price,verification_hash "
      "FROM ownership_history WHERE asset_id=$1 ORDER BY transfer_index ASC;",
      ToDb(asset_id));

  std::vector<model::HistoryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadHistory(row));
  }
  return out;
}

Result PgRepository::IncrementCounter(Transaction& t, model::Counter counter) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO ledger_counters(name,value) VALUES($1,1) "
        "ON CONFLICT(name) DO UPDATE SET value=ledger_counters.value+1;",
        std::string(model::CounterName(counter)));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

model::CountersRecord PgRepository::GetCounters(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT name,value FROM ledger_counters;");

  model::CountersRecord out;
  for (const auto& row : res) {
    const std::string name = row[0].c_str();
    if (name == model::CounterName(model::Counter::TotalAssets)) {
      out.total_assets = FromDb(row[1]);
    } else if (name == model::CounterName(model::Counter::TotalModels)) {
      out.total_models = FromDb(row[1]);
    }
  }
  return out;
}

uint64_t PgRepository::LatestHeight(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT GREATEST(COALESCE((SELECT MAX(creation_timestamp) FROM provenance),0),"
      "COALESCE((SELECT MAX(last_verified) FROM provenance),0),"
      "COALESCE((SELECT MAX(timestamp) FROM ownership_history),0));");
  return FromDb(res[0][0]);
}

} // namespace provenance::db::postgres

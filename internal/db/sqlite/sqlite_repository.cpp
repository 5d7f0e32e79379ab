#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>

namespace provenance::db::sqlite {

using provenance::db::ErrorCode;
using provenance::db::Result;

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql, -1, &st, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(st);
        ThrowStepError(rc, std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Stmt(st);
}

// true on a row, false once the statement is done; every other result throws
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
    const int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc != SQLITE_DONE) {
        ThrowStepError(rc, std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return false;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
    sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col) != 0;
}

model::ProvenanceRecord ReadProvenance(sqlite3_stmt* st) {
    model::ProvenanceRecord r;
    r.asset_id = ColU64(st, 0);
    r.current_owner = ColText(st, 1);
    r.creator = ColText(st, 2);
    r.ai_model_id = ColText(st, 3);
    r.authenticity_score = static_cast<uint32_t>(sqlite3_column_int(st, 4));
    r.creation_timestamp = ColU64(st, 5);
    r.last_verified = ColU64(st, 6);
    r.transfer_count = ColU64(st, 7);
    r.flagged = ColBool(st, 8);
    return r;
}

model::HistoryRecord ReadHistory(sqlite3_stmt* st) {
    model::HistoryRecord r;
    r.asset_id = ColU64(st, 0);
    r.transfer_index = ColU64(st, 1);
    r.from_owner = ColText(st, 2);
    r.to_owner = ColText(st, 3);
    r.timestamp = ColU64(st, 4);
    r.price = ColU64(st, 5);
    r.verification_hash = ColText(st, 6);
    return r;
}

constexpr const char* kSelectProvenance =
    "SELECT asset_id,current_owner,creator,ai_model_id,authenticity_score,"
    "creation_timestamp,last_verified,transfer_count,flagged FROM provenance WHERE asset_id=?;";

constexpr const char* kHistoryColumns =
    "SELECT asset_id,transfer_index,from_owner,to_owner,timestamp,price,verification_hash FROM ownership_history ";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (sqlite3_extended_errcode(db)) {
        case SQLITE_CONSTRAINT_PRIMARYKEY:
        case SQLITE_CONSTRAINT_UNIQUE:
            return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
        default:
            break;
    }

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// AI models
// ------------------------------------------------------------------

Result SqliteRepository::InsertModel(Transaction& t, const model::AIModelRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO ai_models(model_id,name,version,registered_by,confidence_level,is_active) "
        "VALUES(?,?,?,?,?,?);");

    BindText(st.get(), 1, r.model_id);
    BindText(st.get(), 2, r.name);
    BindText(st.get(), 3, r.version);
    BindText(st.get(), 4, r.registered_by);
    BindU64(st.get(), 5, r.confidence_level);
    BindBool(st.get(), 6, r.is_active);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AIModelRecord>
SqliteRepository::GetModel(Transaction& t, const std::string& model_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT model_id,name,version,registered_by,confidence_level,is_active "
        "FROM ai_models WHERE model_id=?;");
    BindText(st.get(), 1, model_id);

    if (!StepRow(db, st.get())) return std::nullopt;

    model::AIModelRecord r;
    r.model_id = ColText(st.get(), 0);
    r.name = ColText(st.get(), 1);
    r.version = ColText(st.get(), 2);
    r.registered_by = ColText(st.get(), 3);
    r.confidence_level = static_cast<uint32_t>(sqlite3_column_int(st.get(), 4));
    r.is_active = ColBool(st.get(), 5);
    return r;
}

// ------------------------------------------------------------------
// Verifiers
// ------------------------------------------------------------------

Result SqliteRepository::UpsertVerifier(Transaction& t, const model::VerifierRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO verifiers(principal,is_authorized) VALUES(?,?) "
        "ON CONFLICT(principal) DO UPDATE SET is_authorized=excluded.is_authorized;");
    BindText(st.get(), 1, r.principal);
    BindBool(st.get(), 2, r.is_authorized);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::VerifierRecord>
SqliteRepository::GetVerifier(Transaction& t, const std::string& principal) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT principal,is_authorized FROM verifiers WHERE principal=?;");
    BindText(st.get(), 1, principal);

    if (!StepRow(db, st.get())) return std::nullopt;

    model::VerifierRecord r;
    r.principal = ColText(st.get(), 0);
    r.is_authorized = ColBool(st.get(), 1);
    return r;
}

// ------------------------------------------------------------------
// Provenance
// ------------------------------------------------------------------

Result SqliteRepository::InsertProvenance(Transaction& t, const model::ProvenanceRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO provenance(asset_id,current_owner,creator,ai_model_id,authenticity_score,"
        "creation_timestamp,last_verified,transfer_count,flagged) VALUES(?,?,?,?,?,?,?,?,?);");

    BindU64(st.get(), 1, r.asset_id);
    BindText(st.get(), 2, r.current_owner);
    BindText(st.get(), 3, r.creator);
    BindText(st.get(), 4, r.ai_model_id);
    BindU64(st.get(), 5, r.authenticity_score);
    BindU64(st.get(), 6, r.creation_timestamp);
    BindU64(st.get(), 7, r.last_verified);
    BindU64(st.get(), 8, r.transfer_count);
    BindBool(st.get(), 9, r.flagged);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ProvenanceRecord>
SqliteRepository::GetProvenance(Transaction& t, uint64_t asset_id) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, kSelectProvenance);
    BindU64(st.get(), 1, asset_id);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadProvenance(st.get());
}

Result SqliteRepository::UpdateProvenance(Transaction& t, const model::ProvenanceRecord& r,
                                          uint64_t expected_transfer_count) {
    auto* db = TX(t).Handle();

    // creator and creation_timestamp are write-once and not part of the SET list
    auto st = Prepare(db,
        "UPDATE provenance SET current_owner=?,ai_model_id=?,authenticity_score=?,last_verified=?,"
        "transfer_count=?,flagged=? WHERE asset_id=? AND transfer_count=?;");

    BindText(st.get(), 1, r.current_owner);
    BindText(st.get(), 2, r.ai_model_id);
    BindU64(st.get(), 3, r.authenticity_score);
    BindU64(st.get(), 4, r.last_verified);
    BindU64(st.get(), 5, r.transfer_count);
    BindBool(st.get(), 6, r.flagged);
    BindU64(st.get(), 7, r.asset_id);
    BindU64(st.get(), 8, expected_transfer_count);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;

    if (sqlite3_changes(db) == 0) {
        if (!GetProvenance(t, r.asset_id).has_value())
            return Result::Err(ErrorCode::NotFound, "asset " + std::to_string(r.asset_id));
        return Result::Err(ErrorCode::Conflict, "transfer_count changed for asset " + std::to_string(r.asset_id));
    }
    return Result::Ok();
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::AppendHistory(Transaction& t, const model::HistoryRecord& r) {
    auto* db = TX(t).Handle();

    // plain INSERT: the primary key rejects any attempt to rewrite an index
    auto st = Prepare(db,
        "INSERT INTO ownership_history(asset_id,transfer_index,from_owner,to_owner,timestamp,price,verification_hash) "
        "VALUES(?,?,?,?,?,?,?);");

    BindU64(st.get(), 1, r.asset_id);
    BindU64(st.get(), 2, r.transfer_index);
    BindText(st.get(), 3, r.from_owner);
    BindText(st.get(), 4, r.to_owner);
    BindU64(st.get(), 5, r.timestamp);
    BindU64(st.get(), 6, r.price);
    BindText(st.get(), 7, r.verification_hash);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::HistoryRecord>
SqliteRepository::GetHistory(Transaction& t, uint64_t asset_id, uint64_t transfer_index) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kHistoryColumns) + "WHERE asset_id=? AND transfer_index=?;";
    auto st = Prepare(db, sql.c_str());
    BindU64(st.get(), 1, asset_id);
    BindU64(st.get(), 2, transfer_index);

    if (!StepRow(db, st.get())) return std::nullopt;
    return ReadHistory(st.get());
}

std::vector<model::HistoryRecord>
SqliteRepository::ListHistory(Transaction& t, uint64_t asset_id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kHistoryColumns) + "WHERE asset_id=? ORDER BY transfer_index ASC;";
    auto st = Prepare(db, sql.c_str());
    BindU64(st.get(), 1, asset_id);

    std::vector<model::HistoryRecord> out;
    while (StepRow(db, st.get())) {
        out.push_back(ReadHistory(st.get()));
    }
    return out;
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

Result SqliteRepository::IncrementCounter(Transaction& t, model::Counter counter) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO ledger_counters(name,value) VALUES(?,1) "
        "ON CONFLICT(name) DO UPDATE SET value=value+1;");
    BindText(st.get(), 1, model::CounterName(counter));

    return Translate(db, sqlite3_step(st.get()));
}

model::CountersRecord SqliteRepository::GetCounters(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "SELECT name,value FROM ledger_counters;");

    model::CountersRecord out;
    while (StepRow(db, st.get())) {
        const auto name = ColText(st.get(), 0);
        if (name == model::CounterName(model::Counter::TotalAssets)) {
            out.total_assets = ColU64(st.get(), 1);
        } else if (name == model::CounterName(model::Counter::TotalModels)) {
            out.total_models = ColU64(st.get(), 1);
        }
    }
    return out;
}

uint64_t SqliteRepository::LatestHeight(Transaction& t) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT MAX(COALESCE((SELECT MAX(creation_timestamp) FROM provenance),0),"
        "COALESCE((SELECT MAX(last_verified) FROM provenance),0),"
        "COALESCE((SELECT MAX(timestamp) FROM ownership_history),0));");

    if (!StepRow(db, st.get())) return 0;
    return ColU64(st.get(), 0);
}

} // namespace provenance::db::sqlite

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/provenance_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/clock.hpp"
#include "internal/util/errors.hpp"

#if PROVENANCE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if PROVENANCE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using provenance::db::BackendError;
using provenance::db::ErrorCode;
using provenance::db::Repository;
using provenance::db::TransactionConflict;
using provenance::db::memory::MemoryRepository;
using provenance::db::model::AIModelRecord;
using provenance::db::model::Counter;
using provenance::db::model::HistoryRecord;
using provenance::db::model::ProvenanceRecord;
using provenance::db::model::VerifierRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

ProvenanceRecord MakeRecord(uint64_t asset_id, const std::string& owner) {
  return ProvenanceRecord{.asset_id           = asset_id,
                          .current_owner      = owner,
                          .creator            = owner,
                          .ai_model_id        = "parity-model",
                          .authenticity_score = 75,
                          .creation_timestamp = 10,
                          .last_verified      = 10,
                          .transfer_count     = 0,
                          .flagged            = false};
}

void VerifyModelReadWrite(Repository& repo, const std::string& model_id) {
  auto tx = repo.Begin();

  AIModelRecord model{.model_id         = model_id,
                      .name             = "Vision Attribution",
                      .version          = "2.1.0",
                      .registered_by    = "owner",
                      .confidence_level = 85,
                      .is_active        = true};
  assert(repo.InsertModel(*tx, model));

  auto duplicate = repo.InsertModel(*tx, model);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  tx->Commit();

  auto read_tx = repo.Begin();
  auto loaded  = repo.GetModel(*read_tx, model_id);
  assert(loaded.has_value());
  assert(loaded->name == "Vision Attribution");
  assert(loaded->version == "2.1.0");
  assert(loaded->registered_by == "owner");
  assert(loaded->confidence_level == 85);
  assert(loaded->is_active);
  assert(!repo.GetModel(*read_tx, model_id + "-missing").has_value());
  read_tx->Commit();
}

void VerifyVerifierUpsert(Repository& repo, const std::string& principal) {
  auto tx = repo.Begin();
  assert(!repo.GetVerifier(*tx, principal).has_value());

  VerifierRecord grant{.principal = principal, .is_authorized = true};
  assert(repo.UpsertVerifier(*tx, grant));
  assert(repo.UpsertVerifier(*tx, grant));

  auto loaded = repo.GetVerifier(*tx, principal);
  assert(loaded.has_value());
  assert(loaded->is_authorized);
  tx->Commit();
}

void VerifyProvenanceCompareAndSwap(Repository& repo, uint64_t asset_id) {
  auto tx = repo.Begin();

  auto record = MakeRecord(asset_id, "alice");
  assert(repo.InsertProvenance(*tx, record));

  auto duplicate = repo.InsertProvenance(*tx, record);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  record.current_owner      = "bob";
  record.transfer_count     = 1;
  record.authenticity_score = 78;
  record.last_verified      = 11;
  assert(repo.UpdateProvenance(*tx, record, 0));

  // stale expectation
  record.current_owner  = "carol";
  record.transfer_count = 2;
  auto stale            = repo.UpdateProvenance(*tx, record, 0);
  assert(stale.code == ErrorCode::Conflict);

  auto missing = repo.UpdateProvenance(*tx, MakeRecord(asset_id + 1000000, "nobody"), 0);
  assert(missing.code == ErrorCode::NotFound);

  tx->Commit();

  auto read_tx = repo.Begin();
  auto loaded  = repo.GetProvenance(*read_tx, asset_id);
  assert(loaded.has_value());
  assert(loaded->current_owner == "bob");
  assert(loaded->creator == "alice");
  assert(loaded->transfer_count == 1);
  assert(loaded->authenticity_score == 78);
  assert(loaded->creation_timestamp == 10);
  assert(loaded->last_verified == 11);
  assert(!loaded->flagged);
  read_tx->Commit();
}

void VerifyHistoryIsInsertOnly(Repository& repo, uint64_t asset_id) {
  auto tx = repo.Begin();

  for (uint64_t index = 0; index < 3; ++index) {
    HistoryRecord entry{.asset_id          = asset_id,
                        .transfer_index    = index,
                        .from_owner        = "owner-" + std::to_string(index),
                        .to_owner          = "owner-" + std::to_string(index + 1),
                        .timestamp         = 100 + index,
                        .price             = 1000 * (index + 1),
                        .verification_hash = "hash-" + std::to_string(index)};
    assert(repo.AppendHistory(*tx, entry));
  }

  HistoryRecord overwrite{.asset_id = asset_id, .transfer_index = 1, .from_owner = "x", .to_owner = "y"};
  auto          rejected = repo.AppendHistory(*tx, overwrite);
  assert(rejected.code == ErrorCode::AlreadyExists);

  tx->Commit();

  auto read_tx = repo.Begin();
  auto entry   = repo.GetHistory(*read_tx, asset_id, 1);
  assert(entry.has_value());
  assert(entry->from_owner == "owner-1");
  assert(entry->to_owner == "owner-2");
  assert(entry->price == 2000);
  assert(entry->verification_hash == "hash-1");

  assert(!repo.GetHistory(*read_tx, asset_id, 3).has_value());

  auto entries = repo.ListHistory(*read_tx, asset_id);
  assert(entries.size() == 3);
  for (uint64_t index = 0; index < entries.size(); ++index) {
    assert(entries[index].transfer_index == index);
  }
  assert(repo.ListHistory(*read_tx, asset_id + 1000000).empty());
  read_tx->Commit();
}

void VerifyCounters(Repository& repo) {
  auto tx     = repo.Begin();
  auto before = repo.GetCounters(*tx);

  assert(repo.IncrementCounter(*tx, Counter::TotalModels));
  assert(repo.IncrementCounter(*tx, Counter::TotalAssets));
  assert(repo.IncrementCounter(*tx, Counter::TotalAssets));

  auto after = repo.GetCounters(*tx);
  assert(after.total_models == before.total_models + 1);
  assert(after.total_assets == before.total_assets + 2);
  tx->Commit();
}

void VerifyLatestHeight(Repository& repo, uint64_t asset_id) {
  auto           tx     = repo.Begin();
  const uint64_t before = repo.LatestHeight(*tx);

  auto record               = MakeRecord(asset_id, "alice");
  record.creation_timestamp = before + 5;
  record.last_verified      = before + 7;
  assert(repo.InsertProvenance(*tx, record));
  assert(repo.LatestHeight(*tx) == before + 7);

  HistoryRecord entry{.asset_id = asset_id, .transfer_index = 0, .from_owner = "alice", .to_owner = "bob", .timestamp = before + 9};
  assert(repo.AppendHistory(*tx, entry));
  assert(repo.LatestHeight(*tx) == before + 9);
  tx->Rollback();
}

void VerifyRollbackBehavior(Repository& repo, uint64_t asset_id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertProvenance(*tx, MakeRecord(asset_id, "alice")));
    assert(repo.IncrementCounter(*tx, Counter::TotalAssets));
    tx->Rollback();
  }
  {
    // destructor rolls back
    auto tx = repo.Begin();
    HistoryRecord entry{.asset_id = asset_id, .transfer_index = 0, .from_owner = "a", .to_owner = "b"};
    assert(repo.AppendHistory(*tx, entry));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetProvenance(*check_tx, asset_id).has_value());
  assert(!repo.GetHistory(*check_tx, asset_id, 0).has_value());
  check_tx->Commit();
}

void VerifyConcurrentTransfersConflict(Repository& repo, uint64_t asset_id, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertProvenance(*tx, MakeRecord(asset_id, "alice")));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();

  auto r1 = repo.GetProvenance(*tx1, asset_id);
  auto r2 = repo.GetProvenance(*tx2, asset_id);
  assert(r1.has_value() && r2.has_value());

  r1->current_owner  = "bob";
  r1->transfer_count = 1;
  r2->current_owner  = "carol";
  r2->transfer_count = 1;

  assert(repo.UpdateProvenance(*tx1, *r1, 0));
  tx1->Commit();

  // the second writer must lose, either at the CAS or at commit
  bool lost = !repo.UpdateProvenance(*tx2, *r2, 0);
  if (!lost) {
    try {
      tx2->Commit();
    } catch (const TransactionConflict&) {
      lost = true;
    }
  }
  assert(lost);
  tx2.reset();

  auto verify_tx = repo.Begin();
  auto final     = repo.GetProvenance(*verify_tx, asset_id);
  assert(final.has_value());
  assert(final->current_owner == "bob");
  assert(final->transfer_count == 1);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, uint64_t asset_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertProvenance(*tx, MakeRecord(asset_id, "alice")));
    HistoryRecord entry{.asset_id = asset_id, .transfer_index = 0, .from_owner = "alice", .to_owner = "bob", .timestamp = 12, .price = 5};
    assert(repo->AppendHistory(*tx, entry));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto p  = repo->GetProvenance(*tx, asset_id);
  assert(p.has_value());
  assert(p->creator == "alice");

  auto h = repo->GetHistory(*tx, asset_id, 0);
  assert(h.has_value());
  assert(h->to_owner == "bob");
  assert(h->price == 5);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if PROVENANCE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("provenance_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<provenance::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<provenance::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if PROVENANCE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("PROVENANCE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("PROVENANCE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<provenance::db::postgres::PgPool>(conninfo);
    pool->BootstrapSchema();
    return std::make_shared<provenance::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

#if PROVENANCE_DB_SQLITE
std::string TempSqlitePath(const std::string& tag) {
  return (std::filesystem::temp_directory_path() / ("provenance_integration_" + tag + "_" + std::to_string(NowMs()) + ".db")).string();
}

void RemoveSqliteFiles(const std::string& db_path) {
  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
}

// A second process holding the write lock surfaces as a storage failure, not an internal one.
void VerifySqliteWriterLockIsStorageError() {
  const auto db_path = TempSqlitePath("sqlite_lock");
  {
    auto holder = std::make_shared<provenance::db::sqlite::SqliteDB>(db_path);
    holder->BootstrapSchema();
    auto contender = std::make_shared<provenance::db::sqlite::SqliteDB>(db_path, true, 50);

    provenance::core::ProvenanceLedger ledger(std::make_shared<provenance::db::sqlite::SqliteRepository>(contender), "owner",
                                              std::make_shared<provenance::util::ManualClock>(10));

    holder->Exec("BEGIN IMMEDIATE;");

    bool threw = false;
    try {
      ledger.RegisterModel("owner", "locked-model", "n", "v", 80);
    } catch (const TransactionConflict& ex) {
      threw = true;
      assert(provenance::util::ToErrorCode(ex) == provenance::ledger::v1::ERROR_CODE_STORAGE);
    }
    assert(threw);

    holder->Exec("ROLLBACK;");

    ledger.RegisterModel("owner", "locked-model", "n", "v", 80);
    assert(ledger.IsActiveModel("locked-model"));
  }
  RemoveSqliteFiles(db_path);
}

template <typename Fn>
void ExpectBackendError(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const BackendError& ex) {
    threw = true;
    assert(provenance::util::ToErrorCode(ex) == provenance::ledger::v1::ERROR_CODE_STORAGE);
  }
  assert(threw);
}

// A failed step on a read is an error, never an empty result.
void VerifySqliteStepFailuresSurface() {
  const auto db_path = TempSqlitePath("sqlite_step");
  {
    auto db = std::make_shared<provenance::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    provenance::db::sqlite::SqliteRepository repo(db);

    {
      auto tx = repo.Begin();
      assert(repo.InsertModel(*tx, AIModelRecord{.model_id = "m", .registered_by = "owner", .confidence_level = 80, .is_active = true}));
      assert(repo.UpsertVerifier(*tx, VerifierRecord{.principal = "v", .is_authorized = true}));
      assert(repo.InsertProvenance(*tx, MakeRecord(7, "alice")));
      assert(repo.AppendHistory(*tx, HistoryRecord{.asset_id = 7, .transfer_index = 0, .from_owner = "alice", .to_owner = "bob"}));
      assert(repo.IncrementCounter(*tx, Counter::TotalAssets));
      tx->Commit();
    }

    auto tx = repo.Begin();

    // interrupt every statement after its first VM instruction
    sqlite3_progress_handler(db->Handle(), 1, [](void*) { return 1; }, nullptr);

    ExpectBackendError([&] { repo.GetModel(*tx, "m"); });
    ExpectBackendError([&] { repo.GetVerifier(*tx, "v"); });
    ExpectBackendError([&] { repo.GetProvenance(*tx, 7); });
    ExpectBackendError([&] { repo.GetHistory(*tx, 7, 0); });
    ExpectBackendError([&] { repo.ListHistory(*tx, 7); });
    ExpectBackendError([&] { repo.GetCounters(*tx); });
    ExpectBackendError([&] { repo.LatestHeight(*tx); });

    sqlite3_progress_handler(db->Handle(), 0, nullptr, nullptr);

    assert(repo.GetProvenance(*tx, 7).has_value());
    assert(repo.ListHistory(*tx, 7).size() == 1);
    tx->Rollback();
  }
  RemoveSqliteFiles(db_path);
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // asset ids are spread per run so a reused postgres database does not collide
  const uint64_t base = NowMs() * 10;

  VerifyModelReadWrite(*repo, backend.name + "-model-" + std::to_string(base));
  VerifyVerifierUpsert(*repo, backend.name + "-verifier-" + std::to_string(base));
  VerifyProvenanceCompareAndSwap(*repo, base + 1);
  VerifyHistoryIsInsertOnly(*repo, base + 2);
  VerifyCounters(*repo);
  VerifyLatestHeight(*repo, base + 6);
  VerifyRollbackBehavior(*repo, base + 3);
  VerifyConcurrentTransfersConflict(*repo, base + 4, backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, base + 5);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if PROVENANCE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if PROVENANCE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

#if PROVENANCE_DB_SQLITE
  VerifySqliteWriterLockIsStorageError();
  VerifySqliteStepFailuresSurface();
#endif

  std::cout << "provenance_integration_repository_parity: pass\n";
  return 0;
}

#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if PROVENANCE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if PROVENANCE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace provenance::factory {

using namespace provenance;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const provenance::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PROVENANCE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->BootstrapSchema();
    PROVENANCE_LOG_INFO("repository ready", {observability::StringField("backend", "sqlite"),
                                             observability::StringField("path", database.sqlite().path()),
                                             observability::BoolField("wal_mode", database.sqlite().wal_mode())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if PROVENANCE_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->BootstrapSchema();
    PROVENANCE_LOG_INFO("repository ready", {observability::StringField("backend", "postgres"),
                                             observability::UintField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  PROVENANCE_LOG_INFO("repository ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

// A persisted ledger may carry heights from an earlier run; the system clock resumes from there.
std::shared_ptr<util::Clock> BuildSystemClock(db::Repository& repository) {
  auto           tx     = repository.Begin();
  const uint64_t height = repository.LatestHeight(*tx);
  tx->Rollback();

  PROVENANCE_LOG_INFO("system clock seeded", {observability::UintField("latest_height", height)});
  return std::make_shared<util::SystemClock>(height);
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const provenance::runtime::config::RuntimeConfig& config, std::shared_ptr<util::Clock> clock) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  if (!clock) {
    clock = BuildSystemClock(*app.repository);
  }

  // ------------------------------------------------------------------
  // Ledger
  // ------------------------------------------------------------------
  app.ledger = std::make_shared<core::ProvenanceLedger>(app.repository, config.ledger().owner(), std::move(clock));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.ledger = app.ledger;

  app.ledger_service = std::make_shared<service::LedgerService>(ctx);

  return app;
}

} // namespace provenance::factory

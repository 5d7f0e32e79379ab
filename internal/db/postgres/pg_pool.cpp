#include "pg_pool.hpp"

#include "internal/db/sql/schema.hpp"

namespace provenance::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    std::unique_lock lock(mutex_);

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();

      std::unique_ptr<pqxx::connection> conn;
      try {
        conn = std::make_unique<pqxx::connection>(conninfo_);
        PrepareStatements(*conn);
      } catch (const std::exception&) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
      return Wrap(conn.release());
    }

    cv_.wait(lock, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
  }
}

void PgPool::BootstrapSchema() {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const auto& statement : sql::PostgresSchema()) {
    tx.exec(statement);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_model",
               "SELECT model_id,name,version,registered_by,confidence_level,is_active "
               "FROM ai_models WHERE model_id=$1");

  conn.prepare("insert_model",
               "INSERT INTO ai_models(model_id,name,version,registered_by,confidence_level,is_active) "
               "VALUES($1,$2,$3,$4,$5,$6) ON CONFLICT (model_id) DO NOTHING");

  conn.prepare("get_provenance",
               "SELECT asset_id,current_owner,creator,ai_model_id,authenticity_score,"
               "creation_timestamp,last_verified,transfer_count,flagged FROM provenance WHERE asset_id=$1");

  conn.prepare("cas_provenance",
               "UPDATE provenance SET current_owner=$2,ai_model_id=$3,authenticity_score=$4,last_verified=$5,"
               "transfer_count=$6,flagged=$7 WHERE asset_id=$1 AND transfer_count=$8");

  conn.prepare("append_history",
               "INSERT INTO ownership_history(asset_id,transfer_index,from_owner,to_owner,timestamp,price,verification_hash) "
               "VALUES($1,$2,$3,$4,$5,$6,$7) ON CONFLICT (asset_id,transfer_index) DO NOTHING");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace provenance::db::postgres

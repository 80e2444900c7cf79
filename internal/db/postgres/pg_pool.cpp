#include "pg_pool.hpp"

#include <array>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vigil::db::postgres {

namespace {

constexpr int kSchemaVersion = 1;

constexpr std::array<std::string_view, 9> kSchema = {
    "CREATE TABLE IF NOT EXISTS batch_index ("
    " storage_key TEXT PRIMARY KEY, batch_id TEXT NOT NULL, source_id TEXT NOT NULL, session_id TEXT NOT NULL,"
    " created_at_ms BIGINT NOT NULL, ingested_at_ms BIGINT NOT NULL, record_count BIGINT NOT NULL,"
    " payload_bytes BIGINT NOT NULL, status SMALLINT NOT NULL DEFAULT 0, dispatched_modules INTEGER NOT NULL DEFAULT 0)",

    "CREATE INDEX IF NOT EXISTS batch_index_source_ingested ON batch_index(source_id, ingested_at_ms)",

    "CREATE INDEX IF NOT EXISTS batch_index_ingested ON batch_index(ingested_at_ms)",

    "CREATE TABLE IF NOT EXISTS module_dispatches ("
    " id BIGSERIAL PRIMARY KEY, storage_key TEXT NOT NULL, module TEXT NOT NULL, status SMALLINT NOT NULL,"
    " error TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL)",

    "CREATE INDEX IF NOT EXISTS module_dispatches_key ON module_dispatches(storage_key)",

    "CREATE TABLE IF NOT EXISTS player_state ("
    " source_id TEXT NOT NULL, entity_id TEXT NOT NULL, state_key TEXT NOT NULL, kind SMALLINT NOT NULL,"
    " value TEXT NOT NULL, updated_at_ms BIGINT NOT NULL, PRIMARY KEY (source_id, entity_id, state_key))",

    "CREATE TABLE IF NOT EXISTS findings ("
    " id BIGSERIAL PRIMARY KEY, module TEXT NOT NULL, entity_id TEXT NOT NULL, check_name TEXT NOT NULL,"
    " severity SMALLINT NOT NULL, confidence DOUBLE PRECISION NOT NULL, evidence JSONB NOT NULL,"
    " timestamp_ms BIGINT NOT NULL, source_id TEXT NOT NULL DEFAULT '', session_id TEXT NOT NULL DEFAULT '',"
    " batch_id TEXT NOT NULL DEFAULT '', title TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '',"
    " received_at_ms BIGINT NOT NULL, UNIQUE(module, entity_id, check_name, timestamp_ms))",

    "CREATE INDEX IF NOT EXISTS findings_entity ON findings(entity_id, id)",

    "CREATE TABLE IF NOT EXISTS vigil_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW())",
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      acquire_timeout_(acquire_timeout) {
}

void PgPool::ApplySchema() {
  // Pooled connections prepare statements against these tables on open,
  // so the schema goes in over a connection of its own.
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  for (const auto sql : kSchema) {
    tx.exec(std::string(sql));
  }
  tx.exec("INSERT INTO vigil_schema_migrations(version) VALUES (" + std::to_string(kSchemaVersion) +
          ") ON CONFLICT DO NOTHING");
  tx.commit();

  VIGIL_LOG_INFO("postgres schema ready", {observability::IntField("version", kSchemaVersion),
                                           observability::IntField("max_connections",
                                                                   static_cast<int64_t>(max_connections_))});
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  const bool       ready = cv_.wait_for(lock, acquire_timeout_, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });
  if (!ready) {
    throw util::Unavailable("postgres pool exhausted (" + std::to_string(max_connections_) + " connections in use)");
  }

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception& e) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw util::Unavailable(std::string("postgres connect: ") + e.what());
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_batch",
               "INSERT INTO batch_index(storage_key,batch_id,source_id,session_id,created_at_ms,ingested_at_ms,"
               "record_count,payload_bytes,status,dispatched_modules) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)");

  conn.prepare("get_batch",
               "SELECT storage_key,batch_id,source_id,session_id,created_at_ms,ingested_at_ms,"
               "record_count,payload_bytes,status,dispatched_modules FROM batch_index WHERE storage_key=$1");

  conn.prepare("update_batch_status", "UPDATE batch_index SET status=$2,dispatched_modules=$3 WHERE storage_key=$1");

  conn.prepare("delete_batch", "DELETE FROM batch_index WHERE storage_key=$1");

  conn.prepare("delete_dispatches", "DELETE FROM module_dispatches WHERE storage_key=$1");

  conn.prepare("insert_dispatch",
               "INSERT INTO module_dispatches(storage_key,module,status,error,created_at_ms) VALUES($1,$2,$3,$4,$5)");

  conn.prepare("get_player_state",
               "SELECT kind,value,updated_at_ms FROM player_state WHERE source_id=$1 AND entity_id=$2 AND state_key=$3");

  conn.prepare("upsert_player_state",
               "INSERT INTO player_state(source_id,entity_id,state_key,kind,value,updated_at_ms) VALUES($1,$2,$3,$4,$5,$6) "
               "ON CONFLICT(source_id,entity_id,state_key) DO UPDATE SET "
               "kind=EXCLUDED.kind,value=EXCLUDED.value,updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("insert_finding",
               "INSERT INTO findings(module,entity_id,check_name,severity,confidence,evidence,timestamp_ms,"
               "source_id,session_id,batch_id,title,description,received_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7,$8,$9,$10,$11,$12,$13)");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released) {
    if (auto self = weak_self.lock()) {
      self->Release(released);
      return;
    }
    delete released;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace vigil::db::postgres

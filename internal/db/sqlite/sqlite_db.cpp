#include "sqlite_db.hpp"

#include <array>
#include <stdexcept>
#include <string_view>

#include "internal/observability/logging.hpp"

namespace vigil::db::sqlite {

namespace {

constexpr int kSchemaVersion = 1;

constexpr std::array<std::string_view, 9> kSchema = {
    "CREATE TABLE IF NOT EXISTS batch_index ("
    " storage_key TEXT PRIMARY KEY, batch_id TEXT NOT NULL, source_id TEXT NOT NULL, session_id TEXT NOT NULL,"
    " created_at_ms INTEGER NOT NULL, ingested_at_ms INTEGER NOT NULL, record_count INTEGER NOT NULL,"
    " payload_bytes INTEGER NOT NULL, status INTEGER NOT NULL DEFAULT 0, dispatched_modules INTEGER NOT NULL DEFAULT 0);",

    "CREATE INDEX IF NOT EXISTS batch_index_source_ingested ON batch_index(source_id, ingested_at_ms);",

    "CREATE INDEX IF NOT EXISTS batch_index_ingested ON batch_index(ingested_at_ms);",

    "CREATE TABLE IF NOT EXISTS module_dispatches ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT, storage_key TEXT NOT NULL, module TEXT NOT NULL,"
    " status INTEGER NOT NULL, error TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS module_dispatches_key ON module_dispatches(storage_key);",

    "CREATE TABLE IF NOT EXISTS player_state ("
    " source_id TEXT NOT NULL, entity_id TEXT NOT NULL, state_key TEXT NOT NULL, kind INTEGER NOT NULL,"
    " value TEXT NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (source_id, entity_id, state_key));",

    "CREATE TABLE IF NOT EXISTS findings ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT, module TEXT NOT NULL, entity_id TEXT NOT NULL, check_name TEXT NOT NULL,"
    " severity INTEGER NOT NULL, confidence REAL NOT NULL, evidence TEXT NOT NULL, timestamp_ms INTEGER NOT NULL,"
    " source_id TEXT NOT NULL DEFAULT '', session_id TEXT NOT NULL DEFAULT '', batch_id TEXT NOT NULL DEFAULT '',"
    " title TEXT NOT NULL DEFAULT '', description TEXT NOT NULL DEFAULT '', received_at_ms INTEGER NOT NULL,"
    " UNIQUE(module, entity_id, check_name, timestamp_ms));",

    "CREATE INDEX IF NOT EXISTS findings_entity ON findings(entity_id, id);",

    "CREATE TABLE IF NOT EXISTS vigil_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
};

void Check(int rc, sqlite3* db, std::string_view what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "open " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure(busy_timeout);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error("sqlite exec: " + msg);
  }
}

void SqliteDB::Configure(std::chrono::milliseconds busy_timeout) {
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Check(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())), db_, "sqlite busy_timeout");
  Exec("PRAGMA temp_store=MEMORY;");
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* st = nullptr;
  Check(sqlite3_prepare_v2(db_, "SELECT COALESCE(MAX(version), 0) FROM vigil_schema_migrations;", -1, &st, nullptr), db_,
        "sqlite prepare");
  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> guard(st, &sqlite3_finalize);

  if (sqlite3_step(st) != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite schema version: ") + sqlite3_errmsg(db_));
  }
  return sqlite3_column_int(st, 0);
}

void SqliteDB::ApplySchema() {
  std::lock_guard lock(tx_mutex_);

  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto sql : kSchema) {
      Exec(std::string(sql));
    }
    Exec("INSERT OR IGNORE INTO vigil_schema_migrations(version, applied_at_ms) VALUES (" + std::to_string(kSchemaVersion) +
         ", CAST(strftime('%s','now') AS INTEGER) * 1000);");
    Exec("COMMIT;");
  } catch (const std::exception& e) {
    VIGIL_LOG_ERROR("sqlite schema bootstrap failed", {observability::StringField("path", path_),
                                                       observability::StringField("error", e.what())});
    Exec("ROLLBACK;");
    throw;
  }

  VIGIL_LOG_INFO("sqlite schema ready", {observability::StringField("path", path_),
                                         observability::IntField("version", SchemaVersion())});
}

} // namespace vigil::db::sqlite

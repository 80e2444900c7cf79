#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace vigil::db::sqlite {

/*
  Owns the single sqlite3* connection of the backend.

  One connection runs one transaction at a time: SqliteTransaction holds
  TxMutex() from BEGIN until COMMIT/ROLLBACK. Opening the database puts it
  in WAL mode with a busy timeout; ApplySchema() creates the batch index,
  dispatch history, player state and findings tables.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Throws std::runtime_error with the sqlite message.
  void Exec(const std::string& sql);

  // Idempotent; records the applied version in vigil_schema_migrations.
  void ApplySchema();

  int SchemaVersion();

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  void Configure(std::chrono::milliseconds busy_timeout);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace vigil::db::sqlite

#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace vigil::db::sqlite {

using vigil::db::ErrorCode;
using vigil::db::Result;

namespace {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

Statement Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return Statement(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

void CheckRow(sqlite3* db, int rc) {
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
}

constexpr const char* kBatchColumns =
    "storage_key,batch_id,source_id,session_id,created_at_ms,ingested_at_ms,"
    "record_count,payload_bytes,status,dispatched_modules";

model::BatchIndexRecord ReadBatch(sqlite3_stmt* st) {
    model::BatchIndexRecord r;
    r.storage_key        = ColText(st, 0);
    r.batch_id           = ColText(st, 1);
    r.source_id          = ColText(st, 2);
    r.session_id         = ColText(st, 3);
    r.created_at_ms      = ColI64(st, 4);
    r.ingested_at_ms     = ColI64(st, 5);
    r.record_count       = ColU64(st, 6);
    r.payload_bytes      = ColU64(st, 7);
    r.status             = static_cast<model::BatchStatus>(ColI32(st, 8));
    r.dispatched_modules = static_cast<uint32_t>(ColI64(st, 9));
    return r;
}

constexpr const char* kFindingColumns =
    "id,module,entity_id,check_name,severity,confidence,evidence,timestamp_ms,"
    "source_id,session_id,batch_id,title,description,received_at_ms";

model::FindingRecord ReadFinding(sqlite3_stmt* st) {
    model::FindingRecord r;
    r.finding_id     = ColU64(st, 0);
    r.module         = ColText(st, 1);
    r.entity_id      = ColText(st, 2);
    r.check          = ColText(st, 3);
    r.severity       = static_cast<vigil::pipeline::v1::Severity>(ColI32(st, 4));
    r.confidence     = sqlite3_column_double(st, 5);
    r.evidence       = ColText(st, 6);
    r.timestamp_ms   = ColI64(st, 7);
    r.source_id      = ColText(st, 8);
    r.session_id     = ColText(st, 9);
    r.batch_id       = ColText(st, 10);
    r.title          = ColText(st, 11);
    r.description    = ColText(st, 12);
    r.received_at_ms = ColI64(st, 13);
    return r;
}

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

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Batch index
// ------------------------------------------------------------------

Result SqliteRepository::InsertBatch(Transaction& t, const model::BatchIndexRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO batch_index(storage_key,batch_id,source_id,session_id,created_at_ms,ingested_at_ms,"
        "record_count,payload_bytes,status,dispatched_modules) VALUES(?,?,?,?,?,?,?,?,?,?);");

    BindText(st.get(), 1, r.storage_key);
    BindText(st.get(), 2, r.batch_id);
    BindText(st.get(), 3, r.source_id);
    BindText(st.get(), 4, r.session_id);
    BindI64(st.get(), 5, r.created_at_ms);
    BindI64(st.get(), 6, r.ingested_at_ms);
    BindU64(st.get(), 7, r.record_count);
    BindU64(st.get(), 8, r.payload_bytes);
    BindI32(st.get(), 9, static_cast<int>(r.status));
    BindI64(st.get(), 10, r.dispatched_modules);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BatchIndexRecord>
SqliteRepository::GetBatch(Transaction& t, const std::string& storage_key) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kBatchColumns + " FROM batch_index WHERE storage_key=?;";
    auto st = Prepare(db, sql.c_str());
    BindText(st.get(), 1, storage_key);

    const int rc = sqlite3_step(st.get());
    CheckRow(db, rc);
    if (rc != SQLITE_ROW) return std::nullopt;
    return ReadBatch(st.get());
}

std::vector<model::BatchIndexRecord>
SqliteRepository::ListBatches(Transaction& t, const std::string& source_id, uint64_t limit) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kBatchColumns + " FROM batch_index";
    if (!source_id.empty()) {
        sql += " WHERE source_id=?";
    }
    sql += " ORDER BY ingested_at_ms DESC, storage_key DESC";
    if (limit > 0) {
        sql += " LIMIT ?";
    }
    sql += ";";

    auto st = Prepare(db, sql.c_str());
    int bind_idx = 1;
    if (!source_id.empty()) BindText(st.get(), bind_idx++, source_id);
    if (limit > 0) BindU64(st.get(), bind_idx++, limit);

    std::vector<model::BatchIndexRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadBatch(st.get()));
    }
    CheckRow(db, rc);
    return out;
}

Result SqliteRepository::UpdateBatchStatus(Transaction& t, const std::string& storage_key, model::BatchStatus status,
                                           uint32_t dispatched_modules) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "UPDATE batch_index SET status=?,dispatched_modules=? WHERE storage_key=?;");
    BindI32(st.get(), 1, static_cast<int>(status));
    BindI64(st.get(), 2, dispatched_modules);
    BindText(st.get(), 3, storage_key);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "batch not indexed: " + storage_key);
    }
    return result;
}

std::vector<model::BatchIndexRecord>
SqliteRepository::ListBatchesIngestedBefore(Transaction& t, int64_t cutoff_ms, uint64_t limit) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kBatchColumns +
                      " FROM batch_index WHERE ingested_at_ms<? ORDER BY ingested_at_ms ASC, storage_key ASC";
    if (limit > 0) {
        sql += " LIMIT ?";
    }
    sql += ";";

    auto st = Prepare(db, sql.c_str());
    BindI64(st.get(), 1, cutoff_ms);
    if (limit > 0) BindU64(st.get(), 2, limit);

    std::vector<model::BatchIndexRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadBatch(st.get()));
    }
    CheckRow(db, rc);
    return out;
}

Result SqliteRepository::DeleteBatch(Transaction& t, const std::string& storage_key) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "DELETE FROM batch_index WHERE storage_key=?;");
    BindText(st.get(), 1, storage_key);
    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) {
        return result;
    }
    if (sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "batch not indexed: " + storage_key);
    }

    auto history = Prepare(db, "DELETE FROM module_dispatches WHERE storage_key=?;");
    BindText(history.get(), 1, storage_key);
    return Translate(db, sqlite3_step(history.get()));
}

// ------------------------------------------------------------------
// Dispatch history
// ------------------------------------------------------------------

Result SqliteRepository::InsertDispatch(Transaction& t, const model::DispatchRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db, "INSERT INTO module_dispatches(storage_key,module,status,error,created_at_ms) VALUES(?,?,?,?,?);");
    BindText(st.get(), 1, r.storage_key);
    BindText(st.get(), 2, r.module);
    BindI32(st.get(), 3, static_cast<int>(r.status));
    BindText(st.get(), 4, r.error);
    BindI64(st.get(), 5, r.created_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::DispatchRecord>
SqliteRepository::ListDispatches(Transaction& t, const std::string& storage_key) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT storage_key,module,status,error,created_at_ms FROM module_dispatches "
        "WHERE storage_key=? ORDER BY id ASC;");
    BindText(st.get(), 1, storage_key);

    std::vector<model::DispatchRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        model::DispatchRecord r;
        r.storage_key   = ColText(st.get(), 0);
        r.module        = ColText(st.get(), 1);
        r.status        = static_cast<model::DispatchStatus>(ColI32(st.get(), 2));
        r.error         = ColText(st.get(), 3);
        r.created_at_ms = ColI64(st.get(), 4);
        out.push_back(std::move(r));
    }
    CheckRow(db, rc);
    return out;
}

// ------------------------------------------------------------------
// Player state
// ------------------------------------------------------------------

std::vector<model::PlayerStateRecord>
SqliteRepository::GetPlayerStates(Transaction& t, const std::string& source_id, const std::string& entity_id,
                                  const std::vector<std::string>& keys) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "SELECT kind,value,updated_at_ms FROM player_state "
        "WHERE source_id=? AND entity_id=? AND state_key=?;");

    std::vector<model::PlayerStateRecord> out;
    for (const auto& key : keys) {
        sqlite3_reset(st.get());
        sqlite3_clear_bindings(st.get());

        BindText(st.get(), 1, source_id);
        BindText(st.get(), 2, entity_id);
        BindText(st.get(), 3, key);

        const int rc = sqlite3_step(st.get());
        CheckRow(db, rc);
        if (rc != SQLITE_ROW) continue;

        model::PlayerStateRecord r;
        r.source_id     = source_id;
        r.entity_id     = entity_id;
        r.key           = key;
        r.kind          = static_cast<vigil::model::ValueKind>(ColI32(st.get(), 0));
        r.value         = ColText(st.get(), 1);
        r.updated_at_ms = ColI64(st.get(), 2);
        out.push_back(std::move(r));
    }
    return out;
}

Result SqliteRepository::UpsertPlayerState(Transaction& t, const model::PlayerStateRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO player_state(source_id,entity_id,state_key,kind,value,updated_at_ms) VALUES(?,?,?,?,?,?) "
        "ON CONFLICT(source_id,entity_id,state_key) DO UPDATE SET "
        "kind=excluded.kind,value=excluded.value,updated_at_ms=excluded.updated_at_ms;");

    BindText(st.get(), 1, r.source_id);
    BindText(st.get(), 2, r.entity_id);
    BindText(st.get(), 3, r.key);
    BindI32(st.get(), 4, static_cast<int>(r.kind));
    BindText(st.get(), 5, r.value);
    BindI64(st.get(), 6, r.updated_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Findings
// ------------------------------------------------------------------

Result SqliteRepository::InsertFinding(Transaction& t, const model::FindingRecord& r) {
    auto* db = TX(t).Handle();

    auto st = Prepare(db,
        "INSERT INTO findings(module,entity_id,check_name,severity,confidence,evidence,timestamp_ms,"
        "source_id,session_id,batch_id,title,description,received_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);");

    BindText(st.get(), 1, r.module);
    BindText(st.get(), 2, r.entity_id);
    BindText(st.get(), 3, r.check);
    BindI32(st.get(), 4, static_cast<int>(r.severity));
    sqlite3_bind_double(st.get(), 5, r.confidence);
    BindText(st.get(), 6, r.evidence);
    BindI64(st.get(), 7, r.timestamp_ms);
    BindText(st.get(), 8, r.source_id);
    BindText(st.get(), 9, r.session_id);
    BindText(st.get(), 10, r.batch_id);
    BindText(st.get(), 11, r.title);
    BindText(st.get(), 12, r.description);
    BindI64(st.get(), 13, r.received_at_ms);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::FindingRecord>
SqliteRepository::ListFindings(Transaction& t, const std::string& entity_id, uint64_t limit) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kFindingColumns + " FROM findings";
    if (!entity_id.empty()) {
        sql += " WHERE entity_id=?";
    }
    sql += " ORDER BY id DESC";
    if (limit > 0) {
        sql += " LIMIT ?";
    }
    sql += ";";

    auto st = Prepare(db, sql.c_str());
    int bind_idx = 1;
    if (!entity_id.empty()) BindText(st.get(), bind_idx++, entity_id);
    if (limit > 0) BindU64(st.get(), bind_idx++, limit);

    std::vector<model::FindingRecord> out;
    int rc;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ReadFinding(st.get()));
    }
    CheckRow(db, rc);
    return out;
}

} // namespace vigil::db::sqlite

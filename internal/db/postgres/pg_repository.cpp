#include "pg_repository.hpp"

namespace vigil::db::postgres {

namespace {

model::BatchIndexRecord ReadBatch(const pqxx::row& row) {
  model::BatchIndexRecord r;
  r.storage_key        = row[0].c_str();
  r.batch_id           = row[1].c_str();
  r.source_id          = row[2].c_str();
  r.session_id         = row[3].c_str();
  r.created_at_ms      = row[4].as<int64_t>();
  r.ingested_at_ms     = row[5].as<int64_t>();
  r.record_count       = row[6].as<uint64_t>();
  r.payload_bytes      = row[7].as<uint64_t>();
  r.status             = (model::BatchStatus)row[8].as<int>();
  r.dispatched_modules = row[9].as<uint32_t>();
  return r;
}

model::FindingRecord ReadFinding(const pqxx::row& row) {
  model::FindingRecord r;
  r.finding_id     = row[0].as<uint64_t>();
  r.module         = row[1].c_str();
  r.entity_id      = row[2].c_str();
  r.check          = row[3].c_str();
  r.severity       = (vigil::pipeline::v1::Severity)row[4].as<int>();
  r.confidence     = row[5].as<double>();
  r.evidence       = row[6].is_null() ? "{}" : row[6].c_str();
  r.timestamp_ms   = row[7].as<int64_t>();
  r.source_id      = row[8].c_str();
  r.session_id     = row[9].c_str();
  r.batch_id       = row[10].c_str();
  r.title          = row[11].c_str();
  r.description    = row[12].c_str();
  r.received_at_ms = row[13].as<int64_t>();
  return r;
}

constexpr const char* kBatchSelect =
    "SELECT storage_key,batch_id,source_id,session_id,created_at_ms,ingested_at_ms,"
    "record_count,payload_bytes,status,dispatched_modules FROM batch_index";

constexpr const char* kFindingSelect =
    "SELECT id,module,entity_id,check_name,severity,confidence,evidence::text,timestamp_ms,"
    "source_id,session_id,batch_id,title,description,received_at_ms FROM findings";

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
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Batch index
// ------------------------------------------------------------------

Result PgRepository::InsertBatch(Transaction& t, const model::BatchIndexRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_batch", r.storage_key, r.batch_id, r.source_id, r.session_id, r.created_at_ms,
                               r.ingested_at_ms, static_cast<int64_t>(r.record_count), static_cast<int64_t>(r.payload_bytes),
                               (int)r.status, static_cast<int64_t>(r.dispatched_modules));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BatchIndexRecord> PgRepository::GetBatch(Transaction& t, const std::string& storage_key) {
  auto res = TX(t).Work().exec_prepared("get_batch", storage_key);
  if (res.empty()) return std::nullopt;
  return ReadBatch(res[0]);
}

std::vector<model::BatchIndexRecord> PgRepository::ListBatches(Transaction& t, const std::string& source_id, uint64_t limit) {
  const int64_t row_limit = limit > 0 ? static_cast<int64_t>(limit) : -1;
  auto          res       = TX(t).Work().exec_params(std::string(kBatchSelect) +
                                                         " WHERE ($1 = '' OR source_id = $1)"
                                                         " ORDER BY ingested_at_ms DESC, storage_key DESC"
                                                         " LIMIT CASE WHEN $2 < 0 THEN NULL ELSE $2 END;",
                                                     source_id, row_limit);

  std::vector<model::BatchIndexRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadBatch(row));
  }
  return out;
}

Result PgRepository::UpdateBatchStatus(Transaction& t, const std::string& storage_key, model::BatchStatus status,
                                       uint32_t dispatched_modules) {
  try {
    auto res = TX(t).Work().exec_prepared("update_batch_status", storage_key, (int)status, static_cast<int64_t>(dispatched_modules));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "batch not indexed: " + storage_key);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BatchIndexRecord> PgRepository::ListBatchesIngestedBefore(Transaction& t, int64_t cutoff_ms,
                                                                             uint64_t limit) {
  const int64_t row_limit = limit > 0 ? static_cast<int64_t>(limit) : -1;
  auto          res       = TX(t).Work().exec_params(std::string(kBatchSelect) +
                                                         " WHERE ingested_at_ms < $1"
                                                         " ORDER BY ingested_at_ms ASC, storage_key ASC"
                                                         " LIMIT CASE WHEN $2 < 0 THEN NULL ELSE $2 END;",
                                                     cutoff_ms, row_limit);

  std::vector<model::BatchIndexRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadBatch(row));
  }
  return out;
}

Result PgRepository::DeleteBatch(Transaction& t, const std::string& storage_key) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_batch", storage_key);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "batch not indexed: " + storage_key);
    }
    TX(t).Work().exec_prepared("delete_dispatches", storage_key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Dispatch history
// ------------------------------------------------------------------

Result PgRepository::InsertDispatch(Transaction& t, const model::DispatchRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_dispatch", r.storage_key, r.module, (int)r.status, r.error, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DispatchRecord> PgRepository::ListDispatches(Transaction& t, const std::string& storage_key) {
  auto res = TX(t).Work().exec_params(
      "SELECT storage_key,module,status,error,created_at_ms FROM module_dispatches WHERE storage_key=$1 ORDER BY id ASC;",
      storage_key);

  std::vector<model::DispatchRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::DispatchRecord r;
    r.storage_key   = row[0].c_str();
    r.module        = row[1].c_str();
    r.status        = (model::DispatchStatus)row[2].as<int>();
    r.error         = row[3].c_str();
    r.created_at_ms = row[4].as<int64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Player state
// ------------------------------------------------------------------

std::vector<model::PlayerStateRecord> PgRepository::GetPlayerStates(Transaction& t, const std::string& source_id,
                                                                    const std::string& entity_id,
                                                                    const std::vector<std::string>& keys) {
  std::vector<model::PlayerStateRecord> out;
  for (const auto& key : keys) {
    auto res = TX(t).Work().exec_prepared("get_player_state", source_id, entity_id, key);
    if (res.empty()) continue;

    model::PlayerStateRecord r;
    r.source_id     = source_id;
    r.entity_id     = entity_id;
    r.key           = key;
    r.kind          = (vigil::model::ValueKind)res[0][0].as<int>();
    r.value         = res[0][1].c_str();
    r.updated_at_ms = res[0][2].as<int64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::UpsertPlayerState(Transaction& t, const model::PlayerStateRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_player_state", r.source_id, r.entity_id, r.key, (int)r.kind, r.value, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Findings
// ------------------------------------------------------------------

Result PgRepository::InsertFinding(Transaction& t, const model::FindingRecord& r) {
  // A failed statement aborts the whole pqxx::work, so a duplicate is
  // detected up front instead of through unique_violation.
  try {
    auto& work = TX(t).Work();
    auto  dup  = work.exec_params(
        "SELECT 1 FROM findings WHERE module=$1 AND entity_id=$2 AND check_name=$3 AND timestamp_ms=$4;", r.module,
        r.entity_id, r.check, r.timestamp_ms);
    if (!dup.empty()) {
      return Result::Err(ErrorCode::AlreadyExists, "duplicate finding");
    }
    work.exec_prepared("insert_finding", r.module, r.entity_id, r.check, (int)r.severity, r.confidence,
                       r.evidence.empty() ? std::string("{}") : r.evidence, r.timestamp_ms, r.source_id, r.session_id,
                       r.batch_id, r.title, r.description, r.received_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FindingRecord> PgRepository::ListFindings(Transaction& t, const std::string& entity_id, uint64_t limit) {
  const int64_t row_limit = limit > 0 ? static_cast<int64_t>(limit) : -1;
  auto          res       = TX(t).Work().exec_params(std::string(kFindingSelect) +
                                                         " WHERE ($1 = '' OR entity_id = $1)"
                                                         " ORDER BY id DESC"
                                                         " LIMIT CASE WHEN $2 < 0 THEN NULL ELSE $2 END;",
                                                     entity_id, row_limit);

  std::vector<model::FindingRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadFinding(row));
  }
  return out;
}

} // namespace vigil::db::postgres

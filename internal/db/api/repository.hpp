#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/batch_index_record.hpp"
#include "internal/db/model/dispatch_record.hpp"
#include "internal/db/model/finding_record.hpp"
#include "internal/db/model/player_state_record.hpp"

namespace vigil::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - InsertBatch / InsertFinding report AlreadyExists on a key collision,
    never a generic constraint error
  - UpsertPlayerState is last-write-wins per (source, entity, key)

  The DB is the source of truth for:
    batch index and dispatch history
    player state
    findings
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Batch index
  // ---------------------------------------------------------------------

  virtual Result InsertBatch(Transaction&, const model::BatchIndexRecord&) = 0;

  virtual std::optional<model::BatchIndexRecord> GetBatch(Transaction&, const std::string& storage_key) = 0;

  // Newest first. An empty source_id lists every source.
  virtual std::vector<model::BatchIndexRecord> ListBatches(Transaction&, const std::string& source_id, uint64_t limit) = 0;

  virtual Result UpdateBatchStatus(Transaction&, const std::string& storage_key, model::BatchStatus status,
                                   uint32_t dispatched_modules) = 0;

  // Oldest first; retention works through these in order.
  virtual std::vector<model::BatchIndexRecord> ListBatchesIngestedBefore(Transaction&, int64_t cutoff_ms,
                                                                         uint64_t limit) = 0;

  // Removes the index entry and its dispatch history. NotFound when absent.
  virtual Result DeleteBatch(Transaction&, const std::string& storage_key) = 0;

  // ---------------------------------------------------------------------
  // Dispatch history
  // ---------------------------------------------------------------------

  virtual Result InsertDispatch(Transaction&, const model::DispatchRecord&) = 0;

  virtual std::vector<model::DispatchRecord> ListDispatches(Transaction&, const std::string& storage_key) = 0;

  // ---------------------------------------------------------------------
  // Player state
  // ---------------------------------------------------------------------

  // Missing keys are simply absent from the result.
  virtual std::vector<model::PlayerStateRecord> GetPlayerStates(Transaction&, const std::string& source_id,
                                                                const std::string& entity_id,
                                                                const std::vector<std::string>& keys) = 0;

  virtual Result UpsertPlayerState(Transaction&, const model::PlayerStateRecord&) = 0;

  // ---------------------------------------------------------------------
  // Findings (append-only)
  // ---------------------------------------------------------------------

  // Dedup key: (module, entity_id, check, timestamp_ms).
  virtual Result InsertFinding(Transaction&, const model::FindingRecord&) = 0;

  // Newest first. An empty entity_id lists every entity.
  virtual std::vector<model::FindingRecord> ListFindings(Transaction&, const std::string& entity_id, uint64_t limit) = 0;
};

} // namespace vigil::db

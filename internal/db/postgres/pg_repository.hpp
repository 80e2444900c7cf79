#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace vigil::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertBatch(Transaction&, const model::BatchIndexRecord&) override;
  std::optional<model::BatchIndexRecord> GetBatch(Transaction&, const std::string& storage_key) override;
  std::vector<model::BatchIndexRecord> ListBatches(Transaction&, const std::string& source_id, uint64_t limit) override;
  Result UpdateBatchStatus(Transaction&, const std::string& storage_key, model::BatchStatus status,
                           uint32_t dispatched_modules) override;
  std::vector<model::BatchIndexRecord> ListBatchesIngestedBefore(Transaction&, int64_t cutoff_ms,
                                                                 uint64_t limit) override;
  Result DeleteBatch(Transaction&, const std::string& storage_key) override;

  Result InsertDispatch(Transaction&, const model::DispatchRecord&) override;
  std::vector<model::DispatchRecord> ListDispatches(Transaction&, const std::string& storage_key) override;

  std::vector<model::PlayerStateRecord> GetPlayerStates(Transaction&, const std::string& source_id,
                                                        const std::string& entity_id,
                                                        const std::vector<std::string>& keys) override;
  Result UpsertPlayerState(Transaction&, const model::PlayerStateRecord&) override;

  Result InsertFinding(Transaction&, const model::FindingRecord&) override;
  std::vector<model::FindingRecord> ListFindings(Transaction&, const std::string& entity_id, uint64_t limit) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <tuple>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace vigil::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  using StateKey   = std::tuple<std::string, std::string, std::string>;
  using FindingKey = std::tuple<std::string, std::string, std::string, int64_t>;

  struct State {
    std::map<std::string, model::BatchIndexRecord> batches;
    std::vector<model::DispatchRecord>             dispatches;
    std::map<StateKey, model::PlayerStateRecord>   player_state;
    std::vector<model::FindingRecord>              findings;
    std::set<FindingKey>                           finding_keys;
    uint64_t                                       next_finding_id = 1;
  };

  using Mutation = std::function<Result(State&)>;

  // Applies the mutation to the transaction's working state and, when it
  // succeeds, records it for replay on commit.
  static Result Apply(Transaction& t, Mutation op);

  std::mutex mutex_;
  State      committed_;
};

}

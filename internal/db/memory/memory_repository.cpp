#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace vigil::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::Apply(Transaction& t, Mutation op) {
  auto& tx     = TX(t);
  auto  result = op(tx.Mutable());
  if (result) {
    tx.Record(std::move(op));
  }
  return result;
}

// ------------------------------------------------------------------
// Batch index
// ------------------------------------------------------------------

Result MemoryRepository::InsertBatch(Transaction& t, const model::BatchIndexRecord& r) {
  return Apply(t, [r](State& s) {
    if (s.batches.contains(r.storage_key)) return Result::Err(ErrorCode::AlreadyExists, "batch already indexed: " + r.storage_key);
    s.batches.emplace(r.storage_key, r);
    return Result::Ok();
  });
}

std::optional<model::BatchIndexRecord> MemoryRepository::GetBatch(Transaction& t, const std::string& storage_key) {
  const auto& s  = TX(t).View();
  auto        it = s.batches.find(storage_key);
  if (it == s.batches.end()) return std::nullopt;
  return it->second;
}

std::vector<model::BatchIndexRecord> MemoryRepository::ListBatches(Transaction& t, const std::string& source_id, uint64_t limit) {
  std::vector<model::BatchIndexRecord> out;
  for (const auto& [_, record] : TX(t).View().batches) {
    if (source_id.empty() || record.source_id == source_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.ingested_at_ms != b.ingested_at_ms) return a.ingested_at_ms > b.ingested_at_ms;
    return a.storage_key > b.storage_key;
  });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::UpdateBatchStatus(Transaction& t, const std::string& storage_key, model::BatchStatus status,
                                           uint32_t dispatched_modules) {
  return Apply(t, [storage_key, status, dispatched_modules](State& s) {
    auto it = s.batches.find(storage_key);
    if (it == s.batches.end()) return Result::Err(ErrorCode::NotFound, "batch not indexed: " + storage_key);
    it->second.status             = status;
    it->second.dispatched_modules = dispatched_modules;
    return Result::Ok();
  });
}

std::vector<model::BatchIndexRecord> MemoryRepository::ListBatchesIngestedBefore(Transaction& t, int64_t cutoff_ms,
                                                                                 uint64_t limit) {
  std::vector<model::BatchIndexRecord> out;
  for (const auto& [_, record] : TX(t).View().batches) {
    if (record.ingested_at_ms < cutoff_ms) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.ingested_at_ms != b.ingested_at_ms) return a.ingested_at_ms < b.ingested_at_ms;
    return a.storage_key < b.storage_key;
  });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::DeleteBatch(Transaction& t, const std::string& storage_key) {
  return Apply(t, [storage_key](State& s) {
    if (s.batches.erase(storage_key) == 0) return Result::Err(ErrorCode::NotFound, "batch not indexed: " + storage_key);
    std::erase_if(s.dispatches, [&](const model::DispatchRecord& d) { return d.storage_key == storage_key; });
    return Result::Ok();
  });
}

// ------------------------------------------------------------------
// Dispatch history
// ------------------------------------------------------------------

Result MemoryRepository::InsertDispatch(Transaction& t, const model::DispatchRecord& r) {
  return Apply(t, [r](State& s) {
    s.dispatches.push_back(r);
    return Result::Ok();
  });
}

std::vector<model::DispatchRecord> MemoryRepository::ListDispatches(Transaction& t, const std::string& storage_key) {
  std::vector<model::DispatchRecord> out;
  for (const auto& record : TX(t).View().dispatches) {
    if (record.storage_key == storage_key) out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Player state
// ------------------------------------------------------------------

std::vector<model::PlayerStateRecord> MemoryRepository::GetPlayerStates(Transaction& t, const std::string& source_id,
                                                                        const std::string& entity_id,
                                                                        const std::vector<std::string>& keys) {
  const auto&                           s = TX(t).View();
  std::vector<model::PlayerStateRecord> out;
  for (const auto& key : keys) {
    auto it = s.player_state.find(StateKey{source_id, entity_id, key});
    if (it != s.player_state.end()) out.push_back(it->second);
  }
  return out;
}

Result MemoryRepository::UpsertPlayerState(Transaction& t, const model::PlayerStateRecord& r) {
  return Apply(t, [r](State& s) {
    s.player_state[StateKey{r.source_id, r.entity_id, r.key}] = r;
    return Result::Ok();
  });
}

// ------------------------------------------------------------------
// Findings
// ------------------------------------------------------------------

Result MemoryRepository::InsertFinding(Transaction& t, const model::FindingRecord& r) {
  return Apply(t, [r](State& s) {
    FindingKey key{r.module, r.entity_id, r.check, r.timestamp_ms};
    if (s.finding_keys.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "duplicate finding");
    s.finding_keys.insert(std::move(key));

    auto stored       = r;
    stored.finding_id = s.next_finding_id++;
    s.findings.push_back(std::move(stored));
    return Result::Ok();
  });
}

std::vector<model::FindingRecord> MemoryRepository::ListFindings(Transaction& t, const std::string& entity_id, uint64_t limit) {
  std::vector<model::FindingRecord> out;
  const auto&                       findings = TX(t).View().findings;
  for (auto it = findings.rbegin(); it != findings.rend(); ++it) {
    if (!entity_id.empty() && it->entity_id != entity_id) continue;
    out.push_back(*it);
    if (limit > 0 && out.size() >= limit) break;
  }
  return out;
}

} // namespace vigil::db::memory

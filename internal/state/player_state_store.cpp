#include "player_state_store.hpp"

#include <algorithm>
#include <functional>
#include <mutex>
#include <set>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace vigil::state {

namespace {

const std::string& RequireKey(const std::string& key) {
  if (key.empty()) {
    throw util::InvalidArgument("player state: key must not be empty");
  }
  return key;
}

void ThrowOnFailure(const db::Result& r, const std::string& what) {
  if (r) {
    return;
  }
  if (r.code == db::ErrorCode::Busy || r.code == db::ErrorCode::IOError) {
    throw util::Unavailable(what + ": " + r.message);
  }
  throw std::runtime_error(what + ": " + r.message);
}

} // namespace

PlayerStateStore::PlayerStateStore(std::shared_ptr<db::Repository> repository, uint32_t max_keys_per_request)
    : repo_(std::move(repository)), max_keys_per_request_(max_keys_per_request == 0 ? 256 : max_keys_per_request) {
  if (!repo_) {
    throw std::invalid_argument("PlayerStateStore: repository is null");
  }
}

std::size_t PlayerStateStore::ShardFor(const std::string& source_id, const std::string& entity_id,
                                       const std::string& key) const {
  std::size_t h = std::hash<std::string>{}(source_id);
  h ^= std::hash<std::string>{}(entity_id) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
  h ^= std::hash<std::string>{}(key) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
  return h % kShardCount;
}

void PlayerStateStore::Validate(const std::string& entity_id, std::size_t key_count) const {
  if (entity_id.empty()) {
    throw util::InvalidArgument("player state: entity_id must not be empty");
  }
  if (key_count > max_keys_per_request_) {
    throw util::InvalidArgument("player state: too many keys in one request (" + std::to_string(key_count) + " > " +
                                std::to_string(max_keys_per_request_) + ")");
  }
}

template <typename KeyRange>
std::vector<std::size_t> PlayerStateStore::ShardsFor(const std::string& source_id, const std::string& entity_id,
                                                     const KeyRange& keys) const {
  std::set<std::size_t> shards;
  for (const auto& key : keys) {
    shards.insert(ShardFor(source_id, entity_id, key));
  }
  return {shards.begin(), shards.end()};
}

std::map<std::string, StoredState> PlayerStateStore::BatchGet(const std::string& source_id,
                                                              const std::string& entity_id,
                                                              const std::vector<std::string>& keys) {
  Validate(entity_id, keys.size());

  std::set<std::string> unique;
  for (const auto& key : keys) {
    unique.insert(RequireKey(key));
  }
  if (unique.empty()) {
    return {};
  }

  std::vector<std::shared_lock<std::shared_mutex>> locks;
  for (auto shard : ShardsFor(source_id, entity_id, unique)) {
    locks.emplace_back(shards_[shard]);
  }

  auto tx   = repo_->Begin();
  auto rows = repo_->GetPlayerStates(*tx, source_id, entity_id, {unique.begin(), unique.end()});
  tx->Commit();

  std::map<std::string, StoredState> out;
  for (const auto& row : rows) {
    out[row.key] = StoredState{model::StateValue::Decode(row.kind, row.value), row.updated_at_ms};
  }
  return out;
}

uint32_t PlayerStateStore::BatchSet(const std::string& source_id, const std::string& entity_id,
                                    const std::map<std::string, model::StateValue>& values, int64_t now_ms) {
  Validate(entity_id, values.size());
  if (values.empty()) {
    return 0;
  }

  std::vector<std::string> keys;
  keys.reserve(values.size());
  for (const auto& [key, _] : values) {
    keys.push_back(RequireKey(key));
  }

  std::vector<std::unique_lock<std::shared_mutex>> locks;
  for (auto shard : ShardsFor(source_id, entity_id, keys)) {
    locks.emplace_back(shards_[shard]);
  }

  auto tx = repo_->Begin();
  for (const auto& [key, value] : values) {
    db::model::PlayerStateRecord record;
    record.source_id     = source_id;
    record.entity_id     = entity_id;
    record.key           = key;
    record.kind          = value.Kind();
    record.value         = value.Encode();
    record.updated_at_ms = now_ms;
    ThrowOnFailure(repo_->UpsertPlayerState(*tx, record), "player state upsert");
  }
  tx->Commit();

  return static_cast<uint32_t>(values.size());
}

} // namespace vigil::state

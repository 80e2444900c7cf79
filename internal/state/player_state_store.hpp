#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/state_value.hpp"

namespace vigil::state {

struct StoredState {
  model::StateValue value;
  int64_t           updated_at_ms = 0;
};

/*
  Per-player key/value state shared by detection modules.

  The repository holds the data. Locks are striped over kShardCount
  shards keyed by (source, entity, key): reads share, writes take every
  touched shard exclusively in ascending shard order, so two overlapping
  BatchSet calls can never deadlock and a BatchGet never sees half of a
  multi-key write.
*/
class PlayerStateStore {
 public:
  static constexpr std::size_t kShardCount = 64;

  explicit PlayerStateStore(std::shared_ptr<db::Repository> repository, uint32_t max_keys_per_request = 256);

  // Missing keys are absent from the result. Duplicate keys are collapsed.
  std::map<std::string, StoredState> BatchGet(const std::string& source_id, const std::string& entity_id,
                                              const std::vector<std::string>& keys);

  // All-or-nothing upsert; returns the number of keys written.
  uint32_t BatchSet(const std::string& source_id, const std::string& entity_id,
                    const std::map<std::string, model::StateValue>& values, int64_t now_ms);

  uint32_t MaxKeysPerRequest() const {
    return max_keys_per_request_;
  }

 private:
  std::size_t ShardFor(const std::string& source_id, const std::string& entity_id, const std::string& key) const;
  void        Validate(const std::string& entity_id, std::size_t key_count) const;

  template <typename KeyRange>
  std::vector<std::size_t> ShardsFor(const std::string& source_id, const std::string& entity_id,
                                     const KeyRange& keys) const;

  std::shared_ptr<db::Repository>             repo_;
  uint32_t                                    max_keys_per_request_;
  mutable std::array<std::shared_mutex, kShardCount> shards_;
};

} // namespace vigil::state

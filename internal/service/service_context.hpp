#pragma once

#include <cstdint>
#include <memory>

namespace vigil::db { class Repository; }
namespace vigil::storage { class BatchStore; }
namespace vigil::dispatch { class Dispatcher; }
namespace vigil::state { class PlayerStateStore; }
namespace vigil::findings { class FindingsSink; }

namespace vigil::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<vigil::db::Repository> repository;
  std::shared_ptr<vigil::storage::BatchStore> batch_store;
  std::shared_ptr<vigil::dispatch::Dispatcher> dispatcher;
  std::shared_ptr<vigil::state::PlayerStateStore> player_state;
  std::shared_ptr<vigil::findings::FindingsSink> findings;
  uint64_t max_payload_bytes = 16ULL * 1024 * 1024;
  // bound on the decompressed batch, checked while inflating
  uint64_t max_decoded_bytes = 128ULL * 1024 * 1024;
};

}

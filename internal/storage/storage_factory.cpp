#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "object/object_batch_store.hpp"

namespace vigil::storage {

BatchStorePtr StorageFactory::Build(const vigil::runtime::config::ObjectStoreConfig& cfg) {
  vigil::runtime::config::ObjectStoreConfig resolved = cfg;
  if (resolved.root_uri().empty()) {
    resolved.set_root_uri("/tmp/vigil/batches");
  }

  auto [fs, root] = common::Unwrap(common::ResolveFileSystem(resolved));
  return std::make_shared<ObjectBatchStore>(std::move(fs), std::move(root));
}

} // namespace vigil::storage

#pragma once

#include <memory>

#include "batch_store.hpp"
#include "config/config.pb.h"

namespace vigil::storage {

/*
  Builds the batch object store from configuration.

      auto store = StorageFactory::Build(config.object_store());
      store->Put(key, buffer);
*/

class StorageFactory {
public:
  static BatchStorePtr Build(const vigil::runtime::config::ObjectStoreConfig& cfg);
};

} // namespace vigil::storage

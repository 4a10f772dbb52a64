#pragma once

#include "object_store.hpp"
#include "config/config.pb.h"

namespace datahub::storage {

/*
  Builds the object store from configuration.

      auto store = StorageFactory::Build(config.storage());
      store->PutObject(key, buffer);
*/

class StorageFactory {
public:
  static ObjectStorePtr Build(const datahub::runtime::config::StorageConfig& cfg);
};

} // namespace datahub::storage

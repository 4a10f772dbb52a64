#include "storage_factory.hpp"

#include "common/arrow_utils.hpp"
#include "object/object_arrow_store.hpp"

namespace datahub::storage {

ObjectStorePtr StorageFactory::Build(const datahub::runtime::config::StorageConfig& cfg) {
  auto [fs, root] = common::Unwrap(common::ResolveFileSystem(cfg));
  return std::make_shared<ObjectArrowStore>(std::move(fs), std::move(root));
}

} // namespace datahub::storage

#pragma once

#include <memory>

namespace datahub::db { class Repository; }
namespace datahub::storage { class ObjectStore; }
namespace datahub::catalog { class DatasetVersionStore; }
namespace datahub::ingest { class UploadSessionManager; }

namespace datahub::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<datahub::ingest::UploadSessionManager> sessions;
  std::shared_ptr<datahub::catalog::DatasetVersionStore> versions;
  std::shared_ptr<datahub::storage::ObjectStore>         store;
  std::shared_ptr<datahub::db::Repository>               repository;
};

}

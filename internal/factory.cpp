#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/catalog/dataset_version_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/catalog_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/identity/authenticator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/quota/quota_guard.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/storage_factory.hpp"
#if DATAHUB_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif
#if DATAHUB_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_schema.hpp"
#endif

namespace datahub::factory {

using datahub::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const datahub::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DATAHUB_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(sqlite_db);
    DATAHUB_LOG_INFO("database ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DATAHUB_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    db::postgres::BootstrapSchema(pool);
    DATAHUB_LOG_INFO("database ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  DATAHUB_LOG_WARN("database is in-memory; nothing survives a restart", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const datahub::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto store      = storage::StorageFactory::Build(config.storage());
  auto repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto quota = std::make_shared<quota::QuotaGuard>(repository, quota::OptionsFromConfig(config.quota()));
  quota->SeedTiers();

  auto versions = std::make_shared<catalog::DatasetVersionStore>(repository);
  auto sessions = std::make_shared<ingest::UploadSessionManager>(repository, store, quota, versions,
                                                                 ingest::OptionsFromConfig(config.ingest()));

  auto auth = std::make_shared<identity::StaticTokenAuthenticator>(identity::StaticTokenAuthenticator::FromConfig(config.auth()));
  if (config.auth().tokens().empty()) {
    DATAHUB_LOG_WARN("no auth tokens configured; every authenticated call will be rejected");
  }

  // ------------------------------------------------------------------
  // Session maintenance
  // ------------------------------------------------------------------
  auto reaper = std::make_shared<runtime::SessionReaper>(sessions, std::chrono::seconds(config.ingest().reaper_interval_seconds()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.sessions   = sessions;
  ctx.versions   = versions;
  ctx.store      = store;
  ctx.repository = repository;

  auto ingest_service  = std::make_shared<service::IngestService>(ctx);
  auto catalog_service = std::make_shared<service::CatalogService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(ingest_service, auth));
  app.grpc_services.push_back(std::make_unique<grpc::CatalogServer>(catalog_service, auth));

  app.repository = repository;
  app.sessions   = sessions;

  // Keep ownership of workers so they live for process lifetime
  app.background_workers.push_back(reaper);

  return app;
}

} // namespace datahub::factory

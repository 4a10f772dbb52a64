#include "pg_schema.hpp"

#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace datahub::db::postgres {

namespace {

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(std::shared_ptr<pqxx::connection> conn) : conn_(std::move(conn)) {
    ExecuteSQL("CREATE TABLE IF NOT EXISTS hub_schema_migrations (version BIGINT PRIMARY KEY, "
               "applied_at TIMESTAMPTZ NOT NULL DEFAULT now());");
  }

  void ExecuteSQL(const std::string& sql) override {
    pqxx::work work(*conn_);
    work.exec(sql);
    work.commit();
  }

  int64_t AppliedVersion() override {
    pqxx::work work(*conn_);
    auto res = work.exec("SELECT COALESCE(MAX(version),0) FROM hub_schema_migrations;");
    work.commit();
    return res[0][0].as<int64_t>();
  }

  void RecordVersion(int64_t version) override {
    pqxx::work work(*conn_);
    work.exec_params("INSERT INTO hub_schema_migrations(version) VALUES($1);", version);
    work.commit();
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
};

const std::vector<std::string>& Migrations() {
  static const std::vector<std::string> kMigrations = {
      // 1: catalog
      "CREATE TABLE IF NOT EXISTS datasets (id TEXT PRIMARY KEY, uid TEXT NOT NULL, name TEXT NOT NULL UNIQUE, description TEXT NOT NULL, "
      "tags TEXT NOT NULL DEFAULT '', likes BIGINT NOT NULL DEFAULT 0, downloads BIGINT NOT NULL DEFAULT 0, "
      "created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);"
      "CREATE TABLE IF NOT EXISTS dataset_versions (dataset_id TEXT NOT NULL REFERENCES datasets(id) ON DELETE CASCADE, "
      "version_id BIGINT NOT NULL, size BIGINT NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (dataset_id, version_id));"
      "CREATE TABLE IF NOT EXISTS files (dataset_id TEXT NOT NULL REFERENCES datasets(id) ON DELETE CASCADE, checksum TEXT NOT NULL, "
      "name TEXT NOT NULL, size BIGINT NOT NULL, object_key TEXT NOT NULL, created_at_ms BIGINT NOT NULL, PRIMARY KEY (dataset_id, checksum));"
      "CREATE TABLE IF NOT EXISTS file_versions (dataset_id TEXT NOT NULL, checksum TEXT NOT NULL, version_id BIGINT NOT NULL, "
      "PRIMARY KEY (dataset_id, checksum, version_id), "
      "FOREIGN KEY (dataset_id, checksum) REFERENCES files(dataset_id, checksum) ON DELETE CASCADE);",

      // 2: users, tiers, usage
      "CREATE TABLE IF NOT EXISTS users (uid TEXT PRIMARY KEY, tier TEXT NOT NULL, dataset_count BIGINT NOT NULL DEFAULT 0, "
      "created_at_ms BIGINT NOT NULL);"
      "CREATE TABLE IF NOT EXISTS tiers (name TEXT PRIMARY KEY, datasets_upload_per_day BIGINT NOT NULL);"
      "CREATE TABLE IF NOT EXISTS usage (id BIGSERIAL PRIMARY KEY, uid TEXT NOT NULL, type TEXT NOT NULL, "
      "payload JSONB NOT NULL, timestamp_ms BIGINT NOT NULL);"
      "CREATE INDEX IF NOT EXISTS usage_uid_type_ts ON usage(uid, type, timestamp_ms);",

      // 3: upload sessions (state 4 = DATASET_PERSISTED)
      "CREATE TABLE IF NOT EXISTS upload_sessions (upload_id TEXT PRIMARY KEY, uid TEXT NOT NULL, dataset_name TEXT NOT NULL, "
      "checksum TEXT NOT NULL, dataset_id TEXT NOT NULL, filename TEXT NOT NULL, description TEXT NOT NULL, tags TEXT NOT NULL, "
      "total_size BIGINT NOT NULL, chunk_size BIGINT NOT NULL, part_count BIGINT NOT NULL, state INTEGER NOT NULL, "
      "storage_upload_id TEXT NOT NULL, object_key TEXT NOT NULL, deduplicated BOOLEAN NOT NULL, version_id BIGINT NOT NULL, "
      "error_message TEXT NOT NULL, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);"
      "CREATE UNIQUE INDEX IF NOT EXISTS upload_sessions_active_key ON upload_sessions(uid, dataset_name, checksum) WHERE state <> 4;"
      "CREATE INDEX IF NOT EXISTS upload_sessions_updated ON upload_sessions(updated_at_ms);"
      "CREATE TABLE IF NOT EXISTS upload_parts (upload_id TEXT NOT NULL REFERENCES upload_sessions(upload_id) ON DELETE CASCADE, "
      "part_number BIGINT NOT NULL, size BIGINT NOT NULL, checksum TEXT NOT NULL, etag TEXT NOT NULL, received_at_ms BIGINT NOT NULL, "
      "PRIMARY KEY (upload_id, part_number));",
  };
  return kMigrations;
}

} // namespace

void BootstrapSchema(const std::shared_ptr<PgPool>& pool) {
  PgMigrationExecutor executor(pool->Acquire());
  sql::RunMigrations(executor, Migrations());
}

} // namespace datahub::db::postgres

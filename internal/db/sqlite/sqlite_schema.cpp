#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"

namespace datahub::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
    db_.Exec("CREATE TABLE IF NOT EXISTS hub_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL DEFAULT (unixepoch() * 1000));");
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int64_t AppliedVersion() override {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db_.Handle(), "SELECT COALESCE(MAX(version),0) FROM hub_schema_migrations;", -1, &st, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("read schema version: ") + sqlite3_errmsg(db_.Handle()));
    }
    int64_t version = 0;
    if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int64(st, 0);
    sqlite3_finalize(st);
    return version;
  }

  void RecordVersion(int64_t version) override {
    db_.Exec("INSERT INTO hub_schema_migrations(version) VALUES(" + std::to_string(version) + ");");
  }

 private:
  SqliteDB& db_;
};

const std::vector<std::string>& Migrations() {
  static const std::vector<std::string> kMigrations = {
      // 1: catalog
      "CREATE TABLE IF NOT EXISTS datasets (id TEXT PRIMARY KEY, uid TEXT NOT NULL, name TEXT NOT NULL UNIQUE, description TEXT NOT NULL, "
      "tags TEXT NOT NULL DEFAULT '', likes INTEGER NOT NULL DEFAULT 0, downloads INTEGER NOT NULL DEFAULT 0, "
      "created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);"
      "CREATE TABLE IF NOT EXISTS dataset_versions (dataset_id TEXT NOT NULL REFERENCES datasets(id) ON DELETE CASCADE, "
      "version_id INTEGER NOT NULL, size INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (dataset_id, version_id));"
      "CREATE TABLE IF NOT EXISTS files (dataset_id TEXT NOT NULL REFERENCES datasets(id) ON DELETE CASCADE, checksum TEXT NOT NULL, "
      "name TEXT NOT NULL, size INTEGER NOT NULL, object_key TEXT NOT NULL, created_at_ms INTEGER NOT NULL, PRIMARY KEY (dataset_id, checksum));"
      "CREATE TABLE IF NOT EXISTS file_versions (dataset_id TEXT NOT NULL, checksum TEXT NOT NULL, version_id INTEGER NOT NULL, "
      "PRIMARY KEY (dataset_id, checksum, version_id), "
      "FOREIGN KEY (dataset_id, checksum) REFERENCES files(dataset_id, checksum) ON DELETE CASCADE);",

      // 2: users, tiers, usage
      "CREATE TABLE IF NOT EXISTS users (uid TEXT PRIMARY KEY, tier TEXT NOT NULL, dataset_count INTEGER NOT NULL DEFAULT 0, "
      "created_at_ms INTEGER NOT NULL);"
      "CREATE TABLE IF NOT EXISTS tiers (name TEXT PRIMARY KEY, datasets_upload_per_day INTEGER NOT NULL);"
      "CREATE TABLE IF NOT EXISTS usage (id INTEGER PRIMARY KEY AUTOINCREMENT, uid TEXT NOT NULL, type TEXT NOT NULL, "
      "payload TEXT NOT NULL, timestamp_ms INTEGER NOT NULL);"
      "CREATE INDEX IF NOT EXISTS usage_uid_type_ts ON usage(uid, type, timestamp_ms);",

      // 3: upload sessions (state 4 = DATASET_PERSISTED)
      "CREATE TABLE IF NOT EXISTS upload_sessions (upload_id TEXT PRIMARY KEY, uid TEXT NOT NULL, dataset_name TEXT NOT NULL, "
      "checksum TEXT NOT NULL, dataset_id TEXT NOT NULL, filename TEXT NOT NULL, description TEXT NOT NULL, tags TEXT NOT NULL, "
      "total_size INTEGER NOT NULL, chunk_size INTEGER NOT NULL, part_count INTEGER NOT NULL, state INTEGER NOT NULL, "
      "storage_upload_id TEXT NOT NULL, object_key TEXT NOT NULL, deduplicated INTEGER NOT NULL, version_id INTEGER NOT NULL, "
      "error_message TEXT NOT NULL, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);"
      "CREATE UNIQUE INDEX IF NOT EXISTS upload_sessions_active_key ON upload_sessions(uid, dataset_name, checksum) WHERE state <> 4;"
      "CREATE INDEX IF NOT EXISTS upload_sessions_updated ON upload_sessions(updated_at_ms);"
      "CREATE TABLE IF NOT EXISTS upload_parts (upload_id TEXT NOT NULL REFERENCES upload_sessions(upload_id) ON DELETE CASCADE, "
      "part_number INTEGER NOT NULL, size INTEGER NOT NULL, checksum TEXT NOT NULL, etag TEXT NOT NULL, received_at_ms INTEGER NOT NULL, "
      "PRIMARY KEY (upload_id, part_number));",
  };
  return kMigrations;
}

} // namespace

void BootstrapSchema(const std::shared_ptr<SqliteDB>& sqlite_db) {
  SqliteMigrationExecutor executor(*sqlite_db);
  sql::RunMigrations(executor, Migrations());
}

} // namespace datahub::db::sqlite

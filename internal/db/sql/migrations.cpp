#include "migrations.hpp"

#include "internal/observability/logging.hpp"

namespace datahub::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  const int64_t applied = executor.AppliedVersion();

  for (size_t i = 0; i < ordered_sql.size(); ++i) {
    const auto version = static_cast<int64_t>(i + 1);
    if (version <= applied) continue;

    executor.ExecuteSQL(ordered_sql[i]);
    executor.RecordVersion(version);
  }

  if (static_cast<int64_t>(ordered_sql.size()) > applied) {
    DATAHUB_LOG_INFO("schema migrated", {datahub::observability::IntField("from_version", applied),
                                         datahub::observability::IntField("to_version", static_cast<int64_t>(ordered_sql.size()))});
  }
}

} // namespace datahub::db::sql

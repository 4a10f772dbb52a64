#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace datahub::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and the version bookkeeping.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest applied migration, 0 when none.
  virtual int64_t AppliedVersion() = 0;

  virtual void RecordVersion(int64_t version) = 0;
};

/*
  Runs migrations in order. Step i (0-based) is migration version i + 1;
  steps at or below AppliedVersion() are skipped.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace datahub::db::sql

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ure::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and reports the highest applied
  version from ure_schema_migrations (0 on a fresh store).
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  virtual int64_t CurrentVersion() = 0;
};

/*
  Runs migrations in order. Migration i (0-based) is version i + 1; versions
  at or below CurrentVersion() are skipped. Returns the number applied.
*/

int RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Schema of the resource store, oldest first.
const std::vector<std::string>& SchemaMigrations();

} // namespace ure::db::sql

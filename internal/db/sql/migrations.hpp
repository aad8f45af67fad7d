#pragma once

#include <string>
#include <vector>

namespace imgvar::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor; versions are 1-based positions
  in the ordered list and are recorded in image_schema_migrations.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  // Highest applied version, 0 on a fresh database.
  virtual int CurrentVersion() = 0;

  // Run one migration and record its version atomically.
  virtual void Apply(int version, const std::string& sql) = 0;
};

/*
  Runs pending migrations in order. Returns the resulting version.
*/
int RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

const std::vector<std::string>& SqliteMigrations();
const std::vector<std::string>& PostgresMigrations();

} // namespace imgvar::db::sql

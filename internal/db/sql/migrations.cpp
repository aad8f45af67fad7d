#include "migrations.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace imgvar::db::sql {

using observability::IntField;

int RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  const int target  = static_cast<int>(ordered_sql.size());
  int       version = executor.CurrentVersion();

  if (version > target) {
    throw std::runtime_error("database schema version " + std::to_string(version) + " is newer than this build (" + std::to_string(target) + ")");
  }

  while (version < target) {
    ++version;
    IMGVAR_LOG_INFO("Upgrading schema", {IntField("version", version)});
    executor.Apply(version, ordered_sql[version - 1]);
  }

  IMGVAR_LOG_DEBUG("Schema up to date", {IntField("version", version)});
  return version;
}

const std::vector<std::string>& SqliteMigrations() {
  static const std::vector<std::string> kMigrations = {
      "CREATE TABLE IF NOT EXISTS images ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT,"
      " storage_kind INTEGER NOT NULL,"
      " locator TEXT NOT NULL,"
      " width INTEGER NOT NULL CHECK (width > 0),"
      " height INTEGER NOT NULL CHECK (height > 0),"
      " parent_id INTEGER REFERENCES images(id) ON DELETE RESTRICT,"
      " wanted_width INTEGER,"
      " wanted_height INTEGER,"
      " format INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL,"
      " CHECK ((wanted_width IS NULL) = (wanted_height IS NULL)));",

      "CREATE INDEX IF NOT EXISTS images_parent_id_idx ON images(parent_id);",
  };
  return kMigrations;
}

const std::vector<std::string>& PostgresMigrations() {
  static const std::vector<std::string> kMigrations = {
      "CREATE TABLE IF NOT EXISTS images ("
      " id BIGSERIAL PRIMARY KEY,"
      " storage_kind SMALLINT NOT NULL,"
      " locator TEXT NOT NULL,"
      " width INTEGER NOT NULL CHECK (width > 0),"
      " height INTEGER NOT NULL CHECK (height > 0),"
      " parent_id BIGINT REFERENCES images(id) ON DELETE RESTRICT,"
      " wanted_width INTEGER,"
      " wanted_height INTEGER,"
      " format SMALLINT NOT NULL,"
      " created_at_ms BIGINT NOT NULL,"
      " CHECK ((wanted_width IS NULL) = (wanted_height IS NULL)));",

      "CREATE INDEX IF NOT EXISTS images_parent_id_idx ON images(parent_id);",
  };
  return kMigrations;
}

} // namespace imgvar::db::sql

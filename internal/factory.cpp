#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/codec/magick_codec.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/disk/disk_blob_store.hpp"
#if IMGVAR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if IMGVAR_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace imgvar::factory {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

std::shared_ptr<db::ImageRepository> BuildRepository(const imgvar::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if IMGVAR_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());

    db::sqlite::SqliteMigrationExecutor migrations(sqlite_db);
    db::sql::RunMigrations(migrations, db::sql::SqliteMigrations());

    IMGVAR_LOG_INFO("Using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if IMGVAR_DB_POSTGRES
    const auto& pg   = database.postgres();
    auto        pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() == 0 ? 16 : pg.max_connections());

    db::postgres::PgMigrationExecutor migrations(pool);
    db::sql::RunMigrations(migrations, db::sql::PostgresMigrations());

    IMGVAR_LOG_INFO("Using postgres repository", {IntField("max_connections", pg.max_connections())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  IMGVAR_LOG_WARN("No database configured, records are kept in memory only");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const imgvar::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Leaves: codec, blobs, records
  // ------------------------------------------------------------------
  app.codec      = std::make_shared<codec::MagickCodec>();
  app.blobs      = std::make_shared<storage::DiskBlobStore>(config.storage().uploads_root());
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  core::PlacementOptions placement_options;
  placement_options.inline_threshold_px = static_cast<int32_t>(config.variants().inline_threshold_px());
  placement_options.fsync               = config.storage().fsync();
  app.placement = std::make_shared<core::PlacementPolicy>(app.codec, app.blobs, placement_options);

  core::ResolverOptions resolver_options;
  resolver_options.public_prefix = config.storage().public_prefix();
  resolver_options.single_flight = config.variants().single_flight();
  app.resolver = std::make_shared<core::VariantResolver>(app.repository, app.codec, app.blobs, app.placement, resolver_options);

  IMGVAR_LOG_INFO("Resolver ready", {StringField("uploads_root", config.storage().uploads_root()),
                                     IntField("inline_threshold_px", placement_options.inline_threshold_px),
                                     BoolField("single_flight", resolver_options.single_flight)});
  return app;
}

} // namespace imgvar::factory

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

#if IMGVAR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if IMGVAR_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using imgvar::db::ErrorCode;
using imgvar::db::ImageRepository;
using imgvar::db::memory::MemoryRepository;
using imgvar::db::model::ImageRecord;
using namespace imgvar::v1;

uint64_t NowMs() {
  return imgvar::util::ToUnixMillis(imgvar::util::Now());
}

struct BackendFactory {
  std::string                                            name;
  std::function<std::shared_ptr<ImageRepository>()>      make_repository;
  std::function<bool()>                                  supports_restart;
  std::function<void(std::shared_ptr<ImageRepository>&)> restart;
  // Writes a row with an unknown format code behind the repository's back.
  std::function<int64_t()>                               insert_corrupt_row;
  std::function<void()>                                  cleanup;
};

ImageRecord Original(int32_t width, int32_t height, StorageKind kind = STORAGE_KIND_FILE_BACKED) {
  ImageRecord r;
  r.storage_kind = kind;
  r.locator      = std::to_string(width) + "_" + std::to_string(height) + "-0-upload.png";
  r.width        = width;
  r.height       = height;
  r.format       = IMAGE_FORMAT_PNG;
  return r;
}

ImageRecord Variant(int64_t parent_id, int32_t width, int32_t height, std::optional<int32_t> wanted_width, std::optional<int32_t> wanted_height) {
  auto r          = Original(width, height, STORAGE_KIND_INLINE);
  r.locator       = "iVBORw0KGgo=";
  r.parent_id     = parent_id;
  r.wanted_width  = wanted_width;
  r.wanted_height = wanted_height;
  return r;
}

int64_t InsertCommitted(ImageRepository& repo, ImageRecord r) {
  auto tx = repo.Begin();
  assert(repo.InsertImage(*tx, r));
  tx->Commit();
  return r.id;
}

void VerifyInsertAndRead(ImageRepository& repo) {
  auto tx = repo.Begin();

  auto original = Original(800, 600);
  assert(repo.InsertImage(*tx, original));
  assert(original.id > 0);
  assert(original.created_at_ms > 0);

  auto read = repo.GetImage(*tx, original.id);
  assert(read.has_value());
  assert(*read == original);
  assert(!read->parent_id.has_value());
  assert(!read->wanted_width.has_value());

  auto child = Variant(original.id, 100, 75, 100, 80);
  assert(repo.InsertImage(*tx, child));
  assert(child.id > original.id);
  tx->Commit();

  auto read_tx = repo.Begin();
  auto stored  = repo.GetImage(*read_tx, child.id);
  assert(stored.has_value());
  assert(stored->parent_id == original.id);
  assert(stored->wanted_width == 100);
  assert(stored->wanted_height == 80);
  assert(stored->storage_kind == STORAGE_KIND_INLINE);
  assert(stored->locator == "iVBORw0KGgo=");
  read_tx->Commit();
}

void VerifyConstraints(ImageRepository& repo) {
  auto tx = repo.Begin();

  auto no_parent = Variant(99999999, 10, 10, 10, 10);
  auto res       = repo.InsertImage(*tx, no_parent);
  assert(!res);
  assert(res.code == ErrorCode::ConstraintViolation);
  tx->Rollback();

  auto tx2 = repo.Begin();
  auto bad = Original(-1, 10);
  assert(!repo.InsertImage(*tx2, bad));
  tx2->Rollback();
}

void VerifyFindChildRule(ImageRepository& repo) {
  const auto parent = InsertCommitted(repo, Original(800, 600));

  const auto sized    = InsertCommitted(repo, Variant(parent, 100, 75, 100, 80));
  const auto unkeyed  = InsertCommitted(repo, Variant(parent, 320, 240, std::nullopt, std::nullopt));
  const auto big      = InsertCommitted(repo, Variant(parent, 640, 480, 640, 480));
  const auto same_w   = InsertCommitted(repo, Variant(parent, 640, 300, 640, 300));

  auto tx = repo.Begin();

  auto hit = repo.FindChild(*tx, parent, 100, 80);
  assert(hit && hit->id == sized);

  hit = repo.FindChild(*tx, parent, 7, 80);
  assert(hit && hit->id == sized);

  // Unkeyed children match on actual size.
  hit = repo.FindChild(*tx, parent, 320, 1);
  assert(hit && hit->id == unkeyed);

  // Two children with wanted_width 640: the taller one wins.
  hit = repo.FindChild(*tx, parent, 640, 1);
  assert(hit && hit->id == big);
  (void)same_w;

  assert(!repo.FindChild(*tx, parent, 1, 1).has_value());
  assert(!repo.FindChild(*tx, sized, 100, 80).has_value());

  auto children = repo.ListChildren(*tx, parent);
  assert(children.size() == 4);
  for (size_t i = 1; i < children.size(); ++i) {
    assert(children[i - 1].id < children[i].id);
  }
  tx->Commit();
}

void VerifyDeleteRules(ImageRepository& repo) {
  const auto parent = InsertCommitted(repo, Original(800, 600));
  const auto child  = InsertCommitted(repo, Variant(parent, 100, 75, 100, 75));

  {
    auto tx  = repo.Begin();
    auto res = repo.DeleteImage(*tx, parent);
    assert(!res && res.code == ErrorCode::Conflict);
    tx->Rollback();
  }
  {
    auto tx  = repo.Begin();
    auto res = repo.DeleteImage(*tx, 987654321);
    assert(!res && res.code == ErrorCode::NotFound);
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.DeleteImage(*tx, child));
    assert(repo.DeleteImage(*tx, parent));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(!repo.GetImage(*tx, parent).has_value());
  assert(!repo.GetImage(*tx, child).has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(ImageRepository& repo) {
  int64_t id = 0;
  {
    auto tx = repo.Begin();
    auto r  = Original(50, 50);
    assert(repo.InsertImage(*tx, r));
    id = r.id;
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(!repo.GetImage(*tx, id).has_value());
    tx->Commit();
  }
  {
    // Dropped without Commit.
    auto tx = repo.Begin();
    auto r  = Original(60, 60);
    assert(repo.InsertImage(*tx, r));
    id = r.id;
  }
  auto tx = repo.Begin();
  assert(!repo.GetImage(*tx, id).has_value());
  tx->Commit();
}

void VerifyCorruptRowFailsRead(BackendFactory& backend, ImageRepository& repo) {
  if (!backend.insert_corrupt_row) {
    return;
  }
  const auto id = backend.insert_corrupt_row();

  auto tx    = repo.Begin();
  bool threw = false;
  try {
    (void)repo.GetImage(*tx, id);
  } catch (const imgvar::util::PersistenceFailure&) {
    threw = true;
  }
  assert(threw);
  tx->Rollback();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto    repo   = backend.make_repository();
  int64_t parent = 0;
  int64_t child  = 0;
  {
    parent = InsertCommitted(*repo, Original(1024, 768));
    child  = InsertCommitted(*repo, Variant(parent, 640, 480, 640, 480));
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto p  = repo->GetImage(*tx, parent);
  assert(p.has_value());
  assert(p->width == 1024);
  auto hit = repo->FindChild(*tx, parent, 640, 480);
  assert(hit.has_value() && hit->id == child);
  tx->Commit();

  // Ids keep increasing after a reopen.
  assert(InsertCommitted(*repo, Original(5, 5)) > child);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name               = "memory",
      .make_repository    = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart   = []() { return false; },
      .restart            = [](std::shared_ptr<ImageRepository>&) {},
      .insert_corrupt_row = nullptr,
      .cleanup            = []() {},
  };
}

#if IMGVAR_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("imgvar_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();
  auto make_repo = [db_path]() {
    auto db = std::make_shared<imgvar::db::sqlite::SqliteDB>(db_path);
    imgvar::db::sqlite::SqliteMigrationExecutor migrations(db);
    const int version = imgvar::db::sql::RunMigrations(migrations, imgvar::db::sql::SqliteMigrations());
    assert(version == static_cast<int>(imgvar::db::sql::SqliteMigrations().size()));
    return std::make_shared<imgvar::db::sqlite::SqliteRepository>(std::move(db));
  };
  auto insert_corrupt = [db_path]() -> int64_t {
    imgvar::db::sqlite::SqliteDB db(db_path);
    db.Exec("INSERT INTO images(storage_kind,locator,width,height,format,created_at_ms) VALUES(1,'bad.png',10,10,99,0);");
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db.Handle()));
  };
  return BackendFactory{
      .name               = "sqlite",
      .make_repository    = make_repo,
      .supports_restart   = []() { return true; },
      .restart            = [make_repo](std::shared_ptr<ImageRepository>& repo) { repo = make_repo(); },
      .insert_corrupt_row = insert_corrupt,
      .cleanup            = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if IMGVAR_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("IMGVAR_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("IMGVAR_TEST_POSTGRES_URI is not set");
  }
  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<imgvar::db::postgres::PgPool>(conninfo);
    imgvar::db::postgres::PgMigrationExecutor migrations(pool);
    imgvar::db::sql::RunMigrations(migrations, imgvar::db::sql::PostgresMigrations());
    return std::make_shared<imgvar::db::postgres::PgRepository>(std::move(pool));
  };
  auto insert_corrupt = [conninfo]() -> int64_t {
    pqxx::connection conn(conninfo);
    pqxx::work       tx(conn);
    auto res = tx.exec("INSERT INTO images(storage_kind,locator,width,height,format,created_at_ms) VALUES(1,'bad.png',10,10,99,0) RETURNING id;");
    tx.commit();
    return res[0][0].as<int64_t>();
  };
  return BackendFactory{
      .name               = "postgres",
      .make_repository    = make_repo,
      .supports_restart   = []() { return true; },
      .restart            = [make_repo](std::shared_ptr<ImageRepository>& repo) { repo = make_repo(); },
      .insert_corrupt_row = insert_corrupt,
      .cleanup            = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  auto repo = backend.make_repository();
  VerifyInsertAndRead(*repo);
  VerifyConstraints(*repo);
  VerifyFindChildRule(*repo);
  VerifyDeleteRules(*repo);
  VerifyRollbackBehavior(*repo);
  VerifyCorruptRowFailsRead(backend, *repo);
  repo.reset();

  VerifyRestartDurability(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if IMGVAR_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif
#if IMGVAR_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "imgvar_integration_repository_parity: pass\n";
  return 0;
}

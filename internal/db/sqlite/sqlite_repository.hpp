#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace imgvar::db::sqlite {

class SqliteRepository final : public db::ImageRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertImage(Transaction&, model::ImageRecord&) override;
  std::optional<model::ImageRecord> GetImage(Transaction&, int64_t) override;
  Result DeleteImage(Transaction&, int64_t) override;

  std::optional<model::ImageRecord> FindChild(Transaction&, int64_t parent_id, int32_t width, int32_t height) override;
  std::vector<model::ImageRecord> ListChildren(Transaction&, int64_t parent_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

/*
  Applies SqliteMigrations() bookkeeping through image_schema_migrations.
*/
class SqliteMigrationExecutor final : public sql::MigrationExecutor {
public:
  explicit SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db);

  int CurrentVersion() override;
  void Apply(int version, const std::string& sql) override;

private:
  std::shared_ptr<SqliteDB> db_;
};

}

#pragma once

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace imgvar::db::postgres {

class PgRepository final : public db::ImageRepository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertImage(Transaction&, model::ImageRecord&) override;
  std::optional<model::ImageRecord> GetImage(Transaction&, int64_t) override;
  Result DeleteImage(Transaction&, int64_t) override;

  std::optional<model::ImageRecord> FindChild(Transaction&, int64_t parent_id, int32_t width, int32_t height) override;
  std::vector<model::ImageRecord> ListChildren(Transaction&, int64_t parent_id) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

class PgMigrationExecutor final : public sql::MigrationExecutor {
public:
  explicit PgMigrationExecutor(std::shared_ptr<PgPool> pool);

  int CurrentVersion() override;
  void Apply(int version, const std::string& sql) override;

private:
  std::shared_ptr<PgPool> pool_;
};

}

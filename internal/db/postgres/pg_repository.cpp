#include "pg_repository.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace imgvar::db::postgres {

namespace {

model::ImageRecord ReadImage(const pqxx::row& row) {
  model::ImageRecord r;
  r.id = row[0].as<int64_t>();

  const int kind_code = row[1].as<int>();
  const auto kind     = model::StorageKindFromCode(kind_code);
  if (!kind) {
    throw util::PersistenceFailure("image " + std::to_string(r.id) + " has unknown storage kind " + std::to_string(kind_code));
  }
  r.storage_kind = *kind;

  r.locator = row[2].c_str();
  r.width   = row[3].as<int32_t>();
  r.height  = row[4].as<int32_t>();
  if (!row[5].is_null()) r.parent_id = row[5].as<int64_t>();
  if (!row[6].is_null()) r.wanted_width = row[6].as<int32_t>();
  if (!row[7].is_null()) r.wanted_height = row[7].as<int32_t>();

  const int format_code = row[8].as<int>();
  const auto format     = model::FormatFromCode(format_code);
  if (!format) {
    throw util::PersistenceFailure("image " + std::to_string(r.id) + " has unknown format " + std::to_string(format_code));
  }
  r.format = *format;

  r.created_at_ms = row[9].as<uint64_t>();
  return r;
}

std::vector<model::ImageRecord> ReadImages(const pqxx::result& res) {
  std::vector<model::ImageRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadImage(row));
  }
  return out;
}

// Query errors surface as PersistenceFailure; decode errors already are one.
template <typename Fn>
auto Query(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::PersistenceFailure&) {
    throw;
  } catch (const pqxx::failure& e) {
    throw util::PersistenceFailure(e.what());
  } catch (const pqxx::conversion_error& e) {
    throw util::PersistenceFailure(e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertImage(Transaction& t, model::ImageRecord& r) {
  if (auto invalid = ValidateForInsert(r); !invalid) return invalid;

  const uint64_t created_at_ms = r.created_at_ms != 0 ? r.created_at_ms : util::ToUnixMillis(util::Now());

  try {
    auto res = TX(t).Work().exec_prepared("insert_image", static_cast<int>(r.storage_kind), r.locator, r.width, r.height, r.parent_id,
                                          r.wanted_width, r.wanted_height, static_cast<int>(r.format), static_cast<int64_t>(created_at_ms));
    r.id            = res[0][0].as<int64_t>();
    r.created_at_ms = created_at_ms;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ImageRecord> PgRepository::GetImage(Transaction& t, int64_t id) {
  return Query([&]() -> std::optional<model::ImageRecord> {
    auto res = TX(t).Work().exec_prepared("get_image", id);
    if (res.empty()) return std::nullopt;
    return ReadImage(res[0]);
  });
}

Result PgRepository::DeleteImage(Transaction& t, int64_t id) {
  try {
    auto& work = TX(t).Work();
    if (work.exec_prepared("get_image", id).empty()) {
      return Result::Err(ErrorCode::NotFound);
    }
    if (work.exec_prepared("count_children", id)[0][0].as<int64_t>() > 0) {
      return Result::Err(ErrorCode::Conflict, "image is referenced by variants");
    }
    work.exec_prepared("delete_image", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ImageRecord> PgRepository::FindChild(Transaction& t, int64_t parent_id, int32_t width, int32_t height) {
  return Query([&]() -> std::optional<model::ImageRecord> {
    auto res = TX(t).Work().exec_prepared("find_child", parent_id, width, height);
    if (res.empty()) return std::nullopt;
    return ReadImage(res[0]);
  });
}

std::vector<model::ImageRecord> PgRepository::ListChildren(Transaction& t, int64_t parent_id) {
  return Query([&] { return ReadImages(TX(t).Work().exec_prepared("list_children", parent_id)); });
}

// ------------------------------------------------------------------
// Migrations
// ------------------------------------------------------------------

PgMigrationExecutor::PgMigrationExecutor(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

int PgMigrationExecutor::CurrentVersion() {
  PgTransaction tx(pool_);
  tx.Work().exec("CREATE TABLE IF NOT EXISTS image_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms BIGINT NOT NULL);");
  auto res = tx.Work().exec("SELECT COALESCE(MAX(version),0) FROM image_schema_migrations;");
  const int version = res[0][0].as<int>();
  tx.Commit();
  return version;
}

void PgMigrationExecutor::Apply(int version, const std::string& sql) {
  PgTransaction tx(pool_);
  tx.Work().exec(sql);
  tx.Work().exec_params("INSERT INTO image_schema_migrations(version,applied_at_ms) VALUES($1,$2);", version,
                        static_cast<int64_t>(util::ToUnixMillis(util::Now())));
  tx.Commit();
}

} // namespace imgvar::db::postgres

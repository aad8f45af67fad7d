#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace imgvar::db::sqlite {

using imgvar::db::ErrorCode;
using imgvar::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

template <typename T>
static void BindOptional(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
    if (v) {
        BindI64(st, idx, static_cast<int64_t>(*v));
    } else {
        sqlite3_bind_null(st, idx);
    }
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static bool ColNull(sqlite3_stmt* st, int col) {
    return sqlite3_column_type(st, col) == SQLITE_NULL;
}

/*
  Decode one row laid out as sql::IMAGE_COLUMNS.
  Unknown enum codes mean corrupted or newer data: fail the read.
*/
static model::ImageRecord ReadImage(sqlite3_stmt* st) {
    model::ImageRecord r;
    r.id = sqlite3_column_int64(st, 0);

    const int kind_code = sqlite3_column_int(st, 1);
    const auto kind = model::StorageKindFromCode(kind_code);
    if (!kind) {
        throw util::PersistenceFailure("image " + std::to_string(r.id) + " has unknown storage kind " + std::to_string(kind_code));
    }
    r.storage_kind = *kind;

    r.locator = ColText(st, 2);
    r.width = sqlite3_column_int(st, 3);
    r.height = sqlite3_column_int(st, 4);
    if (!ColNull(st, 5)) r.parent_id = sqlite3_column_int64(st, 5);
    if (!ColNull(st, 6)) r.wanted_width = sqlite3_column_int(st, 6);
    if (!ColNull(st, 7)) r.wanted_height = sqlite3_column_int(st, 7);

    const int format_code = sqlite3_column_int(st, 8);
    const auto format = model::FormatFromCode(format_code);
    if (!format) {
        throw util::PersistenceFailure("image " + std::to_string(r.id) + " has unknown format " + std::to_string(format_code));
    }
    r.format = *format;

    r.created_at_ms = static_cast<uint64_t>(sqlite3_column_int64(st, 9));
    return r;
}

static std::unique_ptr<Statement> PrepareOrThrow(sqlite3* db, const std::string& sql) {
    try {
        return std::make_unique<Statement>(db, sql.c_str());
    } catch (const std::runtime_error& e) {
        throw util::PersistenceFailure(e.what());
    }
}

// Step a SELECT to completion, decoding every row.
static std::vector<model::ImageRecord> CollectImages(sqlite3* db, sqlite3_stmt* st) {
    std::vector<model::ImageRecord> out;
    for (;;) {
        const int rc = sqlite3_step(st);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            throw util::PersistenceFailure(std::string("sqlite step: ") + sqlite3_errmsg(db));
        }
        out.push_back(ReadImage(st));
    }
    return out;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Records
// ------------------------------------------------------------------

Result SqliteRepository::InsertImage(Transaction& t, model::ImageRecord& r) {
    if (auto invalid = ValidateForInsert(r); !invalid) return invalid;

    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_IMAGE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    const uint64_t created_at_ms = r.created_at_ms != 0 ? r.created_at_ms : util::ToUnixMillis(util::Now());

    BindI32(st, 1, static_cast<int>(r.storage_kind));
    BindText(st, 2, r.locator);
    BindI32(st, 3, r.width);
    BindI32(st, 4, r.height);
    BindOptional(st, 5, r.parent_id);
    BindOptional(st, 6, r.wanted_width);
    BindOptional(st, 7, r.wanted_height);
    BindI32(st, 8, static_cast<int>(r.format));
    BindI64(st, 9, static_cast<int64_t>(created_at_ms));

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        return Translate(db, rc);
    }

    r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    r.created_at_ms = created_at_ms;
    return Result::Ok();
}

std::optional<model::ImageRecord>
SqliteRepository::GetImage(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::SELECT_IMAGE);
    BindI64(st->get(), 1, id);

    auto rows = CollectImages(db, st->get());
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

Result SqliteRepository::DeleteImage(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    if (!GetImage(t, id)) return Result::Err(ErrorCode::NotFound);

    {
        sqlite3_stmt* st = nullptr;
        if (sqlite3_prepare_v2(db, sql::COUNT_CHILDREN, -1, &st, nullptr) != SQLITE_OK)
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
        BindI64(st, 1, id);
        int rc = sqlite3_step(st);
        const int64_t children = rc == SQLITE_ROW ? sqlite3_column_int64(st, 0) : 0;
        sqlite3_finalize(st);
        if (rc != SQLITE_ROW) return Translate(db, rc);
        if (children > 0) return Result::Err(ErrorCode::Conflict, "image is referenced by variants");
    }

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_IMAGE, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Variants
// ------------------------------------------------------------------

std::optional<model::ImageRecord>
SqliteRepository::FindChild(Transaction& t, int64_t parent_id, int32_t width, int32_t height) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::FIND_CHILD);
    BindI64(st->get(), 1, parent_id);
    BindI32(st->get(), 2, width);
    BindI32(st->get(), 3, height);

    auto rows = CollectImages(db, st->get());
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<model::ImageRecord>
SqliteRepository::ListChildren(Transaction& t, int64_t parent_id) {
    auto* db = TX(t).Handle();

    auto st = PrepareOrThrow(db, sql::LIST_CHILDREN);
    BindI64(st->get(), 1, parent_id);
    return CollectImages(db, st->get());
}

// ------------------------------------------------------------------
// Migrations
// ------------------------------------------------------------------

SqliteMigrationExecutor::SqliteMigrationExecutor(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

int SqliteMigrationExecutor::CurrentVersion() {
    std::scoped_lock lock(db_->TxMutex());
    db_->Exec("CREATE TABLE IF NOT EXISTS image_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

    Statement st(db_->Handle(), "SELECT COALESCE(MAX(version),0) FROM image_schema_migrations;");
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        throw std::runtime_error(std::string("reading schema version: ") + sqlite3_errmsg(db_->Handle()));
    }
    return sqlite3_column_int(st.get(), 0);
}

void SqliteMigrationExecutor::Apply(int version, const std::string& sql) {
    SqliteTransaction tx(db_);
    db_->Exec(sql);

    Statement st(db_->Handle(), "INSERT INTO image_schema_migrations(version,applied_at_ms) VALUES(?,?);");
    BindI32(st.get(), 1, version);
    BindI64(st.get(), 2, static_cast<int64_t>(util::ToUnixMillis(util::Now())));
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
        throw std::runtime_error(std::string("recording schema version: ") + sqlite3_errmsg(db_->Handle()));
    }
    tx.Commit();
}

} // namespace imgvar::db::sqlite

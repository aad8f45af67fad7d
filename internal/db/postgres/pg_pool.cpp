#include "pg_pool.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace imgvar::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

// Mirrors sql_queries.hpp with $n placeholders.
void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string columns = sql::IMAGE_COLUMNS;

  conn.prepare("insert_image",
               "INSERT INTO images(storage_kind,locator,width,height,parent_id,wanted_width,wanted_height,format,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) RETURNING id");

  conn.prepare("get_image", "SELECT " + columns + " FROM images WHERE id=$1");

  conn.prepare("delete_image", "DELETE FROM images WHERE id=$1");

  conn.prepare("count_children", "SELECT COUNT(*) FROM images WHERE parent_id=$1");

  conn.prepare("find_child",
               "SELECT " + columns + " FROM images "
               "WHERE parent_id=$1 "
               "AND ((wanted_width IS NULL AND (width=$2 OR height=$3)) "
               "OR wanted_width=$2 OR wanted_height=$3) "
               "ORDER BY width DESC, height DESC "
               "LIMIT 1");

  conn.prepare("list_children", "SELECT " + columns + " FROM images WHERE parent_id=$1 ORDER BY id ASC");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace imgvar::db::postgres

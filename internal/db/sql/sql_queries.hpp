#pragma once

#include <string>

namespace imgvar::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Postgres prepares the same statements with $n placeholders in
  PgPool::PrepareStatements; keep the two in step.

  Column order of every SELECT matches IMAGE_COLUMNS.
*/

inline constexpr const char* IMAGE_COLUMNS = "id,storage_kind,locator,width,height,parent_id,wanted_width,wanted_height,format,created_at_ms";

inline constexpr const char* INSERT_IMAGE =
    "INSERT INTO images(storage_kind,locator,width,height,parent_id,wanted_width,wanted_height,format,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

inline const std::string SELECT_IMAGE = std::string("SELECT ") + IMAGE_COLUMNS + " FROM images WHERE id=?;";

inline constexpr const char* DELETE_IMAGE = "DELETE FROM images WHERE id=?;";

inline constexpr const char* COUNT_CHILDREN = "SELECT COUNT(*) FROM images WHERE parent_id=?;";

// variants

inline const std::string FIND_CHILD = std::string("SELECT ") + IMAGE_COLUMNS +
                                      " FROM images"
                                      " WHERE parent_id=?1"
                                      " AND ((wanted_width IS NULL AND (width=?2 OR height=?3))"
                                      " OR wanted_width=?2 OR wanted_height=?3)"
                                      " ORDER BY width DESC, height DESC"
                                      " LIMIT 1;";

inline const std::string LIST_CHILDREN = std::string("SELECT ") + IMAGE_COLUMNS + " FROM images WHERE parent_id=? ORDER BY id ASC;";

} // namespace imgvar::db::sql

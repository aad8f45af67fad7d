#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/image_record.hpp"

namespace imgvar::db {

/*
  Image record repository.

  CRITICAL GUARANTEES:

  - All operations run inside a Transaction
  - InsertImage assigns the id; the row is visible to any transaction
    started after Commit()
  - Records are write-once; there is no update path
  - DeleteImage refuses (Conflict) while children reference the record

  Reads throw util::PersistenceFailure on backend errors or rows that
  cannot be decoded (unknown enum codes). Writes report through Result.
*/

class ImageRepository {
 public:
  virtual ~ImageRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Records
  // ---------------------------------------------------------------------

  // On success record.id and record.created_at_ms hold the stored values.
  virtual Result InsertImage(Transaction&, model::ImageRecord& record) = 0;

  virtual std::optional<model::ImageRecord> GetImage(Transaction&, int64_t id) = 0;

  virtual Result DeleteImage(Transaction&, int64_t id) = 0;

  // ---------------------------------------------------------------------
  // Variants
  // ---------------------------------------------------------------------

  /*
    Child of parent_id satisfying the variant match rule:

      (wanted_width IS NULL AND (width = w OR height = h))
      OR wanted_width = w OR wanted_height = h

    ordered by width DESC, height DESC; first row wins.
  */
  virtual std::optional<model::ImageRecord> FindChild(Transaction&, int64_t parent_id, int32_t width, int32_t height) = 0;

  // All children of parent_id ordered by id.
  virtual std::vector<model::ImageRecord> ListChildren(Transaction&, int64_t parent_id) = 0;
};

/*
  Row invariants every backend checks before writing.
  SQL backends additionally carry them as CHECK constraints.
*/
inline Result ValidateForInsert(const model::ImageRecord& r) {
  if (r.width <= 0 || r.height <= 0) {
    return Result::Err(ErrorCode::ConstraintViolation, "image dimensions must be positive");
  }
  if (r.wanted_width.has_value() != r.wanted_height.has_value()) {
    return Result::Err(ErrorCode::ConstraintViolation, "wanted_width and wanted_height must be set together");
  }
  if (!imgvar::v1::IsKnownStorageKind(r.storage_kind)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown storage kind");
  }
  if (!imgvar::v1::IsKnownFormat(r.format)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown image format");
  }
  if (r.locator.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "locator must not be empty");
  }
  return Result::Ok();
}

} // namespace imgvar::db

#include "memory_repository.hpp"

#include <algorithm>

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace imgvar::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertImage(Transaction& t, model::ImageRecord& r) {
  if (auto invalid = ValidateForInsert(r); !invalid) return invalid;

  auto& tx = TX(t);
  if (r.parent_id && !tx.View().images.contains(*r.parent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "parent image does not exist");
  }

  r.id = next_id_.fetch_add(1);
  if (r.created_at_ms == 0) {
    r.created_at_ms = util::ToUnixMillis(util::Now());
  }
  tx.RecordInsert(r);
  return Result::Ok();
}

std::optional<model::ImageRecord> MemoryRepository::GetImage(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  const auto  it = s.images.find(id);
  if (it == s.images.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteImage(Transaction& t, int64_t id) {
  auto&       tx = TX(t);
  const auto& s  = tx.View();
  if (!s.images.contains(id)) return Result::Err(ErrorCode::NotFound);

  for (const auto& [_, record] : s.images) {
    if (record.parent_id == id) {
      return Result::Err(ErrorCode::Conflict, "image is referenced by variants");
    }
  }
  tx.RecordDelete(id);
  return Result::Ok();
}

std::optional<model::ImageRecord> MemoryRepository::FindChild(Transaction& t, int64_t parent_id, int32_t width, int32_t height) {
  const model::ImageRecord* best = nullptr;
  for (const auto& [_, record] : TX(t).View().images) {
    if (record.parent_id != parent_id) continue;
    if (!model::MatchesVariantRequest(record, width, height)) continue;
    if (!best || model::VariantOrderBefore(record, *best)) best = &record;
  }
  if (!best) return std::nullopt;
  return *best;
}

std::vector<model::ImageRecord> MemoryRepository::ListChildren(Transaction& t, int64_t parent_id) {
  std::vector<model::ImageRecord> out;
  for (const auto& [_, record] : TX(t).View().images)
    if (record.parent_id == parent_id) out.push_back(record);
  return out;
}

} // namespace imgvar::db::memory

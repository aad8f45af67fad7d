#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace imgvar::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::ImageRepository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertImage(Transaction&, model::ImageRecord&) override;
  std::optional<model::ImageRecord> GetImage(Transaction&, int64_t) override;
  Result DeleteImage(Transaction&, int64_t) override;

  std::optional<model::ImageRecord> FindChild(Transaction&, int64_t parent_id, int32_t width, int32_t height) override;
  std::vector<model::ImageRecord> ListChildren(Transaction&, int64_t parent_id) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::ImageRecord> images;
  };

  // Ids come from a sequence outside transactions, like BIGSERIAL:
  // a rolled back insert burns its id.
  std::atomic<int64_t> next_id_{1};

  std::mutex mutex_;
  State committed_;
};

}

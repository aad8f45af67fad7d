#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace imgvar::db::memory {

/*
  Transaction = snapshot + write log

  Reads see the snapshot taken at Begin() plus this transaction's own
  writes. Commit() replays the log onto the committed state, so two
  transactions inserting different rows never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;

  const MemoryRepository::State& View() const {
    return working_;
  }

  void RecordInsert(const model::ImageRecord& record);
  void RecordDelete(int64_t id);

 private:
  struct Insert {
    model::ImageRecord record;
  };
  struct Delete {
    int64_t id;
  };

  MemoryRepository&                      repo_;
  MemoryRepository::State                working_;
  std::vector<std::variant<Insert, Delete>> log_;
  bool                                   committed_   = false;
  bool                                   rolled_back_ = false;
};

} // namespace imgvar::db::memory

#include "memory_tx.hpp"

#include <set>
#include <stdexcept>
#include <string>

namespace imgvar::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::RecordInsert(const model::ImageRecord& record) {
  working_.images[record.id] = record;
  log_.push_back(Insert{record});
}

void MemoryTransaction::RecordDelete(int64_t id) {
  working_.images.erase(id);
  log_.push_back(Delete{id});
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  auto& images = repo_.committed_.images;

  // Validate the whole log first so a failed commit leaves nothing behind.
  std::set<int64_t> inserted;
  for (const auto& op : log_) {
    if (const auto* ins = std::get_if<Insert>(&op)) {
      const auto& parent = ins->record.parent_id;
      if (parent && !images.contains(*parent) && !inserted.contains(*parent)) {
        throw std::runtime_error("transaction conflict: parent image " + std::to_string(*parent) + " was deleted concurrently");
      }
      inserted.insert(ins->record.id);
    } else if (const auto* del = std::get_if<Delete>(&op)) {
      for (const auto& [_, record] : images) {
        if (record.parent_id == del->id) {
          throw std::runtime_error("transaction conflict: image " + std::to_string(del->id) + " gained a child concurrently");
        }
      }
    }
  }

  for (auto& op : log_) {
    if (auto* ins = std::get_if<Insert>(&op)) {
      images[ins->record.id] = std::move(ins->record);
    } else {
      images.erase(std::get<Delete>(op).id);
    }
  }
  log_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  log_.clear();
  rolled_back_ = true;
}

} // namespace imgvar::db::memory

#include "ram_blob_store.hpp"

#include <mutex>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace imgvar::storage {

using namespace imgvar::storage::common;

/*
  Zero-copy read.
*/
std::shared_ptr<arrow::Buffer> RamBlobStore::Read(const std::string& locator) {
  std::shared_lock lock(mutex_);

  auto it = buffers_.find(locator);
  if (it == buffers_.end()) throw util::NotFound("no blob at " + locator);

  return it->second;
}

void RamBlobStore::Write(const std::string& locator, const std::shared_ptr<arrow::Buffer>& buffer, bool /*fsync unused*/) {
  ValidateLocator(locator);
  if (!buffer) throw util::StorageWriteFailure("null buffer for " + locator);

  std::unique_lock lock(mutex_);
  buffers_[locator] = buffer;
}

void RamBlobStore::Remove(const std::string& locator) {
  std::unique_lock lock(mutex_);
  buffers_.erase(locator);
}

bool RamBlobStore::Exists(const std::string& locator) {
  std::shared_lock lock(mutex_);
  return buffers_.count(locator) > 0;
}

size_t RamBlobStore::Count() const {
  std::shared_lock lock(mutex_);
  return buffers_.size();
}

} // namespace imgvar::storage

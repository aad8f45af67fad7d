#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>

#include <arrow/buffer.h>

#include "internal/storage/blob_store.hpp"

namespace imgvar::storage {

/*
  In-memory blob store.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamBlobStore final : public BlobStore {
public:
  RamBlobStore() = default;
  ~RamBlobStore() override = default;

  std::shared_ptr<arrow::Buffer> Read(const std::string& locator) override;

  void Write(const std::string& locator,
             const std::shared_ptr<arrow::Buffer>& buffer,
             bool fsync) override;

  void Remove(const std::string& locator) override;

  bool Exists(const std::string& locator) override;

  size_t Count() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<arrow::Buffer>> buffers_;
};

} // namespace imgvar::storage

#pragma once

#include <filesystem>
#include <arrow/buffer.h>

#include "internal/storage/blob_store.hpp"

namespace imgvar::storage {

/*
  Durable disk storage using Arrow IO.

  Properties:
    - atomic replace writes
    - optional fsync
    - locators resolve below root only
*/

class DiskBlobStore final : public BlobStore {
public:
  explicit DiskBlobStore(std::filesystem::path root);

  std::shared_ptr<arrow::Buffer> Read(const std::string& locator) override;

  void Write(const std::string& locator,
             const std::shared_ptr<arrow::Buffer>& buffer,
             bool fsync) override;

  void Remove(const std::string& locator) override;

  bool Exists(const std::string& locator) override;

private:
  std::filesystem::path root_;
};

}

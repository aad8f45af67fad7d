#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

namespace imgvar::storage {

/*
  Blob storage for file-backed images.

  Every blob is an Arrow Buffer addressed by a locator: a relative
  path under the store root ("640_480-1700000000-orig_7.png").
  The resolver never touches the filesystem directly.

  Implementations:
    DISK → Arrow file IO under the uploads root
    RAM  → in-memory Arrow buffers (tests, ephemeral deployments)
*/

class BlobStore {
 public:
  virtual ~BlobStore() = default;

  /*
    Read an entire blob.

    Throws util::NotFound when no blob lives at the locator.
  */
  virtual std::shared_ptr<arrow::Buffer> Read(const std::string& locator) = 0;

  /*
    Persist a blob, replacing any previous content at the locator.

    Throws util::StorageWriteFailure; a failed write leaves no partial
    blob behind.
  */
  virtual void Write(const std::string& locator, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  // Missing blobs are not an error.
  virtual void Remove(const std::string& locator) = 0;

  virtual bool Exists(const std::string& locator) = 0;
};

using BlobStorePtr = std::shared_ptr<BlobStore>;

} // namespace imgvar::storage

#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "imgvar/v1.hpp"
#include "internal/codec/image_codec.hpp"
#include "internal/core/placement_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/storage/blob_store.hpp"

namespace imgvar::core {

struct ResolverOptions {
  // Prefix of rendered file-backed locators.
  std::string public_prefix = "/assets/uploads";

  // Serialize concurrent misses on the same (parent, width, height).
  bool single_flight = false;
};

/*
  Resolves size variants of stored images.

  A request is answered, in order, by:
    1. the image itself when it already fits (never upscales)
    2. an existing child matching the request
    3. a freshly resized, placed and persisted child

  All failures are util::ImageError subclasses. Nothing is retried.
*/
class VariantResolver {
 public:
  VariantResolver(std::shared_ptr<db::ImageRepository> repository, codec::ImageCodecPtr codec, storage::BlobStorePtr blobs,
                  std::shared_ptr<PlacementPolicy> placement, ResolverOptions options = {});

  db::model::ImageRecord GetWithSize(const db::model::ImageRecord& image, int32_t width, int32_t height);

  // Throws util::NotFound for an unknown id.
  db::model::ImageRecord GetWithSize(int64_t image_id, int32_t width, int32_t height);

  // "data:image/png;base64,..." or "<public_prefix>/<relative path>".
  std::string GetLocator(const db::model::ImageRecord& image) const;

  // Store an original (no parent) from encoded bytes.
  db::model::ImageRecord ImportOriginal(const std::shared_ptr<arrow::Buffer>& bytes, imgvar::v1::ImageFormat format);

  db::model::ImageRecord Find(int64_t image_id);

  std::vector<db::model::ImageRecord> Children(int64_t image_id);

  // Wire view with the rendered locator.
  imgvar::v1::ImageDescriptor Describe(const db::model::ImageRecord& image) const;

  // Stored encoded bytes of a record, whichever way it is kept.
  std::shared_ptr<arrow::Buffer> ReadEncoded(const db::model::ImageRecord& image);

  // Keys with a single-flight resolution in progress.
  size_t InFlightKeys() const;

 private:
  // Holds the mutex of one (parent, width, height) key. The map entry goes
  // away when the last holder leaves.
  class KeyLock {
   public:
    KeyLock(VariantResolver& owner, std::string key);
    ~KeyLock();

    KeyLock(const KeyLock&)            = delete;
    KeyLock& operator=(const KeyLock&) = delete;

   private:
    VariantResolver&             owner_;
    std::string                  key_;
    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  db::model::ImageRecord CreateVariant(const db::model::ImageRecord& parent, int32_t width, int32_t height);
  db::model::ImageRecord Persist(db::model::ImageRecord record);
  std::optional<db::model::ImageRecord> LookupChild(int64_t parent_id, int32_t width, int32_t height);

  std::unique_ptr<db::Transaction> BeginTx();
  std::shared_ptr<std::mutex>      AcquireKeyMutex(const std::string& key);
  void                             ReleaseKeyMutex(const std::string& key);

  std::shared_ptr<db::ImageRepository> repository_;
  codec::ImageCodecPtr                 codec_;
  storage::BlobStorePtr                blobs_;
  std::shared_ptr<PlacementPolicy>     placement_;
  ResolverOptions                      options_;

  mutable std::mutex                                            key_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> key_mutexes_;
};

} // namespace imgvar::core

#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>

#include "imgvar/v1.hpp"
#include "internal/codec/image_codec.hpp"
#include "internal/storage/blob_store.hpp"

namespace imgvar::core {

/*
  Where and how an encoded image is kept.

  Small images (both sides strictly below the inline threshold) are
  PNG-encoded and base64-embedded in the locator. Everything else is
  encoded in the requested format and written to the blob store.
*/

struct PlacementOptions {
  int32_t inline_threshold_px = 200;
  bool    fsync               = false;
};

struct Placement {
  imgvar::v1::StorageKind kind = imgvar::v1::STORAGE_KIND_UNSPECIFIED;
  std::string             locator;
  int32_t                 width  = 0;
  int32_t                 height = 0;
  imgvar::v1::ImageFormat format = imgvar::v1::IMAGE_FORMAT_UNSPECIFIED;
};

class PlacementPolicy {
 public:
  PlacementPolicy(codec::ImageCodecPtr codec, storage::BlobStorePtr blobs, PlacementOptions options = {});

  /*
    Encode and store image. For file-backed placements the blob is
    written before returning; throws util::EncodeFailure or
    util::StorageWriteFailure.
  */
  Placement Place(const codec::RasterImage& image, imgvar::v1::ImageFormat requested, const std::string& suffix);

  const PlacementOptions& Options() const {
    return options_;
  }

  static bool ShouldInline(int32_t width, int32_t height, int32_t threshold_px);

  // "<w>_<h>-<unix seconds>-<suffix>.<ext>"
  static std::string FileName(int32_t width, int32_t height, int64_t unix_seconds, const std::string& suffix, imgvar::v1::ImageFormat format);

  static const char* Extension(imgvar::v1::ImageFormat format);

 private:
  codec::ImageCodecPtr  codec_;
  storage::BlobStorePtr blobs_;
  PlacementOptions      options_;
};

} // namespace imgvar::core

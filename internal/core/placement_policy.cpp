#include "placement_policy.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace imgvar::core {

using namespace imgvar::v1;
using observability::IntField;
using observability::StringField;

PlacementPolicy::PlacementPolicy(codec::ImageCodecPtr codec, storage::BlobStorePtr blobs, PlacementOptions options)
    : codec_(std::move(codec)), blobs_(std::move(blobs)), options_(options) {
  if (!codec_ || !blobs_) {
    throw std::invalid_argument("placement policy needs a codec and a blob store");
  }
  if (options_.inline_threshold_px < 0) {
    throw std::invalid_argument("inline threshold must not be negative");
  }
}

bool PlacementPolicy::ShouldInline(int32_t width, int32_t height, int32_t threshold_px) {
  return width < threshold_px && height < threshold_px;
}

const char* PlacementPolicy::Extension(ImageFormat format) {
  switch (format) {
    case IMAGE_FORMAT_PNG:
      return "png";
    case IMAGE_FORMAT_GIF:
      return "gif";
    case IMAGE_FORMAT_JPEG:
      return "jpg";
    default:
      throw util::EncodeFailure("no file extension for image format " + std::to_string(static_cast<int>(format)));
  }
}

std::string PlacementPolicy::FileName(int32_t width, int32_t height, int64_t unix_seconds, const std::string& suffix, ImageFormat format) {
  return std::to_string(width) + "_" + std::to_string(height) + "-" + std::to_string(unix_seconds) + "-" + suffix + "." + Extension(format);
}

Placement PlacementPolicy::Place(const codec::RasterImage& image, ImageFormat requested, const std::string& suffix) {
  Placement placement;
  placement.width  = image.width;
  placement.height = image.height;

  if (ShouldInline(image.width, image.height, options_.inline_threshold_px)) {
    auto encoded = codec_->Encode(image, IMAGE_FORMAT_PNG);

    placement.kind    = STORAGE_KIND_INLINE;
    placement.format  = IMAGE_FORMAT_PNG;
    placement.locator = codec_->ToBase64(encoded);
    return placement;
  }

  // Validate before spending time in the encoder.
  const auto name = FileName(image.width, image.height, util::ToUnixSeconds(util::Now()), suffix, requested);

  auto encoded = codec_->Encode(image, requested);
  blobs_->Write(name, encoded, options_.fsync);

  IMGVAR_LOG_DEBUG("Wrote image blob", {StringField("locator", name), IntField("bytes", encoded->size())});

  placement.kind    = STORAGE_KIND_FILE_BACKED;
  placement.format  = requested;
  placement.locator = name;
  return placement;
}

} // namespace imgvar::core

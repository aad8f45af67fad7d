#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "imgvar/v1.hpp"

namespace imgvar::codec {

/*
  Decoded raster, 8-bit RGBA, row-major, no padding.
*/
struct RasterImage {
  int32_t width  = 0;
  int32_t height = 0;
  std::vector<uint8_t> rgba;
};

/*
  Codec abstraction.

  Decode throws util::DecodeFailure, Encode throws util::EncodeFailure.
  Implementations must be safe to call from several threads at once.
*/
class ImageCodec {
 public:
  virtual ~ImageCodec() = default;

  virtual RasterImage Decode(const std::shared_ptr<arrow::Buffer>& bytes) = 0;

  // Fit inside width x height keeping the aspect ratio.
  virtual RasterImage Resize(const RasterImage& image, int32_t width, int32_t height) = 0;

  virtual std::shared_ptr<arrow::Buffer> Encode(const RasterImage& image, imgvar::v1::ImageFormat format) = 0;

  // Inline payload helpers.
  virtual std::string ToBase64(const std::shared_ptr<arrow::Buffer>& bytes) = 0;
  virtual std::shared_ptr<arrow::Buffer> FromBase64(const std::string& payload) = 0;
};

using ImageCodecPtr = std::shared_ptr<ImageCodec>;

} // namespace imgvar::codec

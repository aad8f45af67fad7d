#pragma once

#include "image_codec.hpp"

namespace imgvar::codec {

/*
  ImageMagick (Magick++) codec.

  Resizing uses the Lanczos filter. JPEG output drops the alpha channel.
*/
class MagickCodec final : public ImageCodec {
 public:
  MagickCodec();

  RasterImage Decode(const std::shared_ptr<arrow::Buffer>& bytes) override;
  RasterImage Resize(const RasterImage& image, int32_t width, int32_t height) override;
  std::shared_ptr<arrow::Buffer> Encode(const RasterImage& image, imgvar::v1::ImageFormat format) override;

  std::string ToBase64(const std::shared_ptr<arrow::Buffer>& bytes) override;
  std::shared_ptr<arrow::Buffer> FromBase64(const std::string& payload) override;

  // ImageMagick coder name ("PNG", "GIF", "JPEG").
  static const char* MagickName(imgvar::v1::ImageFormat format);
};

} // namespace imgvar::codec

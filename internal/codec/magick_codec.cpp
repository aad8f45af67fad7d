#include "magick_codec.hpp"

#include <Magick++.h>

#include <mutex>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace imgvar::codec {

using observability::SizeField;
using observability::StringField;

namespace {

std::once_flag g_magick_init;

Magick::Image ToMagick(const RasterImage& image) {
  if (image.width <= 0 || image.height <= 0 ||
      image.rgba.size() != static_cast<size_t>(image.width) * static_cast<size_t>(image.height) * 4) {
    throw std::invalid_argument("raster size does not match its pixel buffer");
  }
  Magick::Image img(static_cast<size_t>(image.width), static_cast<size_t>(image.height), "RGBA", Magick::CharPixel, image.rgba.data());
  img.quiet(true);
  return img;
}

RasterImage FromMagick(Magick::Image& img) {
  RasterImage out;
  out.width  = static_cast<int32_t>(img.columns());
  out.height = static_cast<int32_t>(img.rows());
  out.rgba.resize(static_cast<size_t>(out.width) * static_cast<size_t>(out.height) * 4);
  img.write(0, 0, img.columns(), img.rows(), "RGBA", Magick::CharPixel, out.rgba.data());
  return out;
}

} // namespace

MagickCodec::MagickCodec() {
  std::call_once(g_magick_init, [] { Magick::InitializeMagick(nullptr); });
}

const char* MagickCodec::MagickName(imgvar::v1::ImageFormat format) {
  switch (format) {
    case imgvar::v1::IMAGE_FORMAT_PNG:
      return "PNG";
    case imgvar::v1::IMAGE_FORMAT_GIF:
      return "GIF";
    case imgvar::v1::IMAGE_FORMAT_JPEG:
      return "JPEG";
    default:
      throw util::EncodeFailure("unsupported image format " + std::to_string(static_cast<int>(format)));
  }
}

RasterImage MagickCodec::Decode(const std::shared_ptr<arrow::Buffer>& bytes) {
  if (!bytes || bytes->size() == 0) {
    throw util::DecodeFailure("empty image data");
  }

  try {
    Magick::Blob blob(bytes->data(), static_cast<size_t>(bytes->size()));

    Magick::Image img;
    img.quiet(true);
    img.read(blob);

    return FromMagick(img);
  } catch (const Magick::Exception& e) {
    throw util::DecodeFailure(std::string("decode: ") + e.what());
  }
}

RasterImage MagickCodec::Resize(const RasterImage& image, int32_t width, int32_t height) {
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("resize target must be positive");
  }

  try {
    auto img = ToMagick(image);
    img.filterType(Magick::LanczosFilter);

    // Plain WxH geometry keeps the aspect ratio and fits inside the box.
    img.resize(Magick::Geometry(static_cast<size_t>(width), static_cast<size_t>(height)));

    IMGVAR_LOG_DEBUG("Resized raster", {SizeField("from", image.width, image.height),
                                        SizeField("to", static_cast<int32_t>(img.columns()), static_cast<int32_t>(img.rows()))});
    return FromMagick(img);
  } catch (const Magick::Exception& e) {
    throw util::EncodeFailure(std::string("resize: ") + e.what());
  }
}

std::shared_ptr<arrow::Buffer> MagickCodec::Encode(const RasterImage& image, imgvar::v1::ImageFormat format) {
  const char* name = MagickName(format);

  try {
    auto img = ToMagick(image);
    img.magick(name);
    if (format == imgvar::v1::IMAGE_FORMAT_JPEG) {
      img.quality(90);
    }

    Magick::Blob blob;
    img.write(&blob);

    if (blob.length() == 0) {
      throw util::EncodeFailure(std::string("encoder produced no ") + name + " data");
    }
    return storage::common::CopyToBuffer(blob.data(), blob.length());
  } catch (const Magick::Exception& e) {
    IMGVAR_LOG_ERROR("Encode failed", {StringField("format", name), StringField("error", e.what())});
    throw util::EncodeFailure(std::string("encode ") + name + ": " + e.what());
  }
}

std::string MagickCodec::ToBase64(const std::shared_ptr<arrow::Buffer>& bytes) {
  Magick::Blob blob(bytes->data(), static_cast<size_t>(bytes->size()));
  return blob.base64();
}

std::shared_ptr<arrow::Buffer> MagickCodec::FromBase64(const std::string& payload) {
  Magick::Blob blob;
  blob.base64(payload);
  if (blob.length() == 0) {
    throw util::DecodeFailure("inline payload is not valid base64");
  }
  return storage::common::CopyToBuffer(blob.data(), blob.length());
}

} // namespace imgvar::codec

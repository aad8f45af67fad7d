#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/codec/magick_codec.hpp"
#include "internal/core/placement_policy.hpp"
#include "internal/storage/ram/ram_blob_store.hpp"
#include "internal/util/errors.hpp"
#include "raster_fixtures.hpp"

namespace {

using imgvar::core::PlacementOptions;
using imgvar::core::PlacementPolicy;
using namespace imgvar::v1;

struct Fixture {
  std::shared_ptr<imgvar::codec::MagickCodec>   codec = std::make_shared<imgvar::codec::MagickCodec>();
  std::shared_ptr<imgvar::storage::RamBlobStore> blobs = std::make_shared<imgvar::storage::RamBlobStore>();
  PlacementPolicy                                 policy{codec, blobs};
};

void TestShouldInlineIsStrictOnBothAxes() {
  assert(PlacementPolicy::ShouldInline(199, 199, 200));
  assert(PlacementPolicy::ShouldInline(1, 1, 200));
  assert(!PlacementPolicy::ShouldInline(200, 1, 200));
  assert(!PlacementPolicy::ShouldInline(1, 200, 200));
  assert(!PlacementPolicy::ShouldInline(640, 480, 200));
  // Zero threshold disables inlining.
  assert(!PlacementPolicy::ShouldInline(1, 1, 0));
}

void TestFileName() {
  assert(PlacementPolicy::FileName(640, 480, 1700000000, "orig_7", IMAGE_FORMAT_PNG) == "640_480-1700000000-orig_7.png");
  assert(PlacementPolicy::FileName(300, 200, 5, "orig_1", IMAGE_FORMAT_GIF) == "300_200-5-orig_1.gif");
  assert(PlacementPolicy::FileName(300, 200, 5, "upload", IMAGE_FORMAT_JPEG) == "300_200-5-upload.jpg");

  bool threw = false;
  try {
    (void)PlacementPolicy::Extension(IMAGE_FORMAT_UNSPECIFIED);
  } catch (const imgvar::util::EncodeFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestSmallImagesAreInlinePng() {
  Fixture f;

  auto placement = f.policy.Place(imgvar::testing::GradientRaster(100, 75), IMAGE_FORMAT_JPEG, "orig_1");
  assert(placement.kind == STORAGE_KIND_INLINE);
  assert(placement.format == IMAGE_FORMAT_PNG);
  assert(placement.width == 100 && placement.height == 75);
  assert(placement.locator.rfind("iVBORw0KGgo", 0) == 0);
  assert(f.blobs->Count() == 0);

  // The payload decodes back to the same raster size.
  auto decoded = f.codec->Decode(f.codec->FromBase64(placement.locator));
  assert(decoded.width == 100 && decoded.height == 75);
}

void TestLargeImagesAreFileBacked() {
  Fixture f;

  auto placement = f.policy.Place(imgvar::testing::GradientRaster(640, 480), IMAGE_FORMAT_GIF, "orig_3");
  assert(placement.kind == STORAGE_KIND_FILE_BACKED);
  assert(placement.format == IMAGE_FORMAT_GIF);
  assert(placement.locator.rfind("640_480-", 0) == 0);
  assert(placement.locator.find("-orig_3.gif") != std::string::npos);
  assert(f.blobs->Exists(placement.locator));

  auto decoded = f.codec->Decode(f.blobs->Read(placement.locator));
  assert(decoded.width == 640 && decoded.height == 480);
}

void TestOneLongSideIsEnoughForFile() {
  Fixture f;

  auto placement = f.policy.Place(imgvar::testing::GradientRaster(200, 1), IMAGE_FORMAT_PNG, "orig_9");
  assert(placement.kind == STORAGE_KIND_FILE_BACKED);
  assert(f.blobs->Count() == 1);
}

void TestCustomThreshold() {
  auto codec = std::make_shared<imgvar::codec::MagickCodec>();
  auto blobs = std::make_shared<imgvar::storage::RamBlobStore>();

  PlacementOptions options;
  options.inline_threshold_px = 32;
  PlacementPolicy policy(codec, blobs, options);

  assert(policy.Place(imgvar::testing::GradientRaster(31, 31), IMAGE_FORMAT_PNG, "x").kind == STORAGE_KIND_INLINE);
  assert(policy.Place(imgvar::testing::GradientRaster(100, 75), IMAGE_FORMAT_PNG, "x").kind == STORAGE_KIND_FILE_BACKED);
}

} // namespace

int main() {
  TestShouldInlineIsStrictOnBothAxes();
  TestFileName();
  TestSmallImagesAreInlinePng();
  TestLargeImagesAreFileBacked();
  TestOneLongSideIsEnoughForFile();
  TestCustomThreshold();

  std::cout << "imgvar_unit_placement_policy: pass\n";
  return 0;
}

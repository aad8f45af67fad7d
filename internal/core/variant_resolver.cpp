#include "variant_resolver.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace imgvar::core {

using namespace imgvar::v1;
using db::model::ImageRecord;
using observability::IntField;
using observability::SizeField;
using observability::StringField;

namespace {

constexpr const char* kImportSuffix = "upload";

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context + ": " + db::ToString(result.code) : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::PersistenceFailure(message);
  }
}

void CommitOrThrow(db::Transaction& tx, const std::string& context) {
  try {
    tx.Commit();
  } catch (const util::ImageError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PersistenceFailure(context + ": " + e.what());
  }
}

} // namespace

VariantResolver::VariantResolver(std::shared_ptr<db::ImageRepository> repository, codec::ImageCodecPtr codec, storage::BlobStorePtr blobs,
                                 std::shared_ptr<PlacementPolicy> placement, ResolverOptions options)
    : repository_(std::move(repository)),
      codec_(std::move(codec)),
      blobs_(std::move(blobs)),
      placement_(std::move(placement)),
      options_(std::move(options)) {
  if (!repository_ || !codec_ || !blobs_ || !placement_) {
    throw std::invalid_argument("variant resolver is missing a dependency");
  }
}

std::unique_ptr<db::Transaction> VariantResolver::BeginTx() {
  try {
    return repository_->Begin();
  } catch (const util::ImageError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PersistenceFailure(std::string("begin transaction: ") + e.what());
  }
}

std::shared_ptr<std::mutex> VariantResolver::AcquireKeyMutex(const std::string& key) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  auto&                       key_mutex = key_mutexes_[key];
  if (!key_mutex) {
    key_mutex = std::make_shared<std::mutex>();
  }
  return key_mutex;
}

// Copies are only handed out under the guard, so a use count of one seen
// here means no other caller holds or is about to take this mutex.
void VariantResolver::ReleaseKeyMutex(const std::string& key) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  auto                        it = key_mutexes_.find(key);
  if (it != key_mutexes_.end() && it->second.use_count() == 1) {
    key_mutexes_.erase(it);
  }
}

size_t VariantResolver::InFlightKeys() const {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  return key_mutexes_.size();
}

VariantResolver::KeyLock::KeyLock(VariantResolver& owner, std::string key)
    : owner_(owner), key_(std::move(key)), mutex_(owner_.AcquireKeyMutex(key_)), lock_(*mutex_) {
}

VariantResolver::KeyLock::~KeyLock() {
  lock_.unlock();
  mutex_.reset();
  owner_.ReleaseKeyMutex(key_);
}

ImageRecord VariantResolver::Find(int64_t image_id) {
  auto tx     = BeginTx();
  auto record = repository_->GetImage(*tx, image_id);
  if (!record.has_value()) throw util::NotFound("image " + std::to_string(image_id) + " not found");
  CommitOrThrow(*tx, "find image");
  return *record;
}

std::vector<ImageRecord> VariantResolver::Children(int64_t image_id) {
  auto tx = BeginTx();
  if (!repository_->GetImage(*tx, image_id).has_value()) {
    throw util::NotFound("image " + std::to_string(image_id) + " not found");
  }
  auto children = repository_->ListChildren(*tx, image_id);
  CommitOrThrow(*tx, "list children");
  return children;
}

std::optional<ImageRecord> VariantResolver::LookupChild(int64_t parent_id, int32_t width, int32_t height) {
  auto tx  = BeginTx();
  auto hit = repository_->FindChild(*tx, parent_id, width, height);
  CommitOrThrow(*tx, "find child");
  return hit;
}

ImageRecord VariantResolver::GetWithSize(int64_t image_id, int32_t width, int32_t height) {
  return GetWithSize(Find(image_id), width, height);
}

ImageRecord VariantResolver::GetWithSize(const ImageRecord& image, int32_t width, int32_t height) {
  if (width <= 0 || height <= 0) {
    throw std::invalid_argument("requested size must be positive, got " + std::to_string(width) + "x" + std::to_string(height));
  }

  // Already small enough. Never upscale.
  if (image.width <= width && image.height <= height) {
    return image;
  }

  if (auto hit = LookupChild(image.id, width, height)) {
    IMGVAR_LOG_DEBUG("Variant hit",
                     {IntField("parent_id", image.id), IntField("variant_id", hit->id), SizeField("wanted", width, height)});
    return *hit;
  }

  if (!options_.single_flight) {
    return CreateVariant(image, width, height);
  }

  KeyLock key_lock(*this, std::to_string(image.id) + ":" + std::to_string(width) + "x" + std::to_string(height));

  // Another caller may have finished while we waited.
  if (auto hit = LookupChild(image.id, width, height)) {
    return *hit;
  }
  return CreateVariant(image, width, height);
}

ImageRecord VariantResolver::CreateVariant(const ImageRecord& parent, int32_t width, int32_t height) {
  const auto source  = codec_->Decode(ReadEncoded(parent));
  const auto resized = codec_->Resize(source, width, height);

  const auto placement = placement_->Place(resized, parent.format, "orig_" + std::to_string(parent.id));

  ImageRecord record;
  record.storage_kind  = placement.kind;
  record.locator       = placement.locator;
  record.width         = placement.width;
  record.height        = placement.height;
  record.format        = placement.format;
  record.parent_id     = parent.id;
  record.wanted_width  = width;
  record.wanted_height = height;

  auto stored = Persist(std::move(record));

  IMGVAR_LOG_INFO("Created variant", {IntField("parent_id", parent.id), IntField("variant_id", stored.id), SizeField("wanted", width, height),
                                      SizeField("size", stored.width, stored.height),
                                      StringField("storage", StorageKind_Name(stored.storage_kind))});
  return stored;
}

/*
  Insert, commit, then re-read in a fresh transaction so callers get
  exactly what the backend stored.
*/
ImageRecord VariantResolver::Persist(ImageRecord record) {
  try {
    auto tx = BeginTx();
    ThrowIfDbError(repository_->InsertImage(*tx, record), "insert image");
    CommitOrThrow(*tx, "insert image");
  } catch (const util::ImageError& e) {
    if (record.storage_kind == STORAGE_KIND_FILE_BACKED) {
      IMGVAR_LOG_WARN("Orphaned image blob", {StringField("locator", record.locator), StringField("error", e.what())});
    }
    throw;
  }

  auto tx     = BeginTx();
  auto stored = repository_->GetImage(*tx, record.id);
  if (!stored.has_value()) {
    throw util::PersistenceFailure("image " + std::to_string(record.id) + " vanished after insert");
  }
  CommitOrThrow(*tx, "re-read image");
  return *stored;
}

ImageRecord VariantResolver::ImportOriginal(const std::shared_ptr<arrow::Buffer>& bytes, ImageFormat format) {
  if (!IsKnownFormat(format)) {
    throw std::invalid_argument("unsupported image format " + std::to_string(static_cast<int>(format)));
  }

  const auto raster    = codec_->Decode(bytes);
  const auto placement = placement_->Place(raster, format, kImportSuffix);

  ImageRecord record;
  record.storage_kind = placement.kind;
  record.locator      = placement.locator;
  record.width        = placement.width;
  record.height       = placement.height;
  record.format       = placement.format;

  auto stored = Persist(std::move(record));
  IMGVAR_LOG_INFO("Imported image", {IntField("image_id", stored.id), SizeField("size", stored.width, stored.height),
                                     StringField("storage", StorageKind_Name(stored.storage_kind))});
  return stored;
}

std::shared_ptr<arrow::Buffer> VariantResolver::ReadEncoded(const ImageRecord& image) {
  switch (image.storage_kind) {
    case STORAGE_KIND_INLINE:
      return codec_->FromBase64(image.locator);
    case STORAGE_KIND_FILE_BACKED:
      try {
        return blobs_->Read(image.locator);
      } catch (const util::ImageError&) {
        throw;
      } catch (const std::exception& e) {
        throw util::DecodeFailure("reading " + image.locator + ": " + e.what());
      }
    default:
      throw util::PersistenceFailure("image " + std::to_string(image.id) + " has no storage kind");
  }
}

std::string VariantResolver::GetLocator(const ImageRecord& image) const {
  switch (image.storage_kind) {
    case STORAGE_KIND_INLINE:
      return "data:image/png;base64," + image.locator;
    case STORAGE_KIND_FILE_BACKED: {
      std::string prefix = options_.public_prefix;
      while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
      return prefix + "/" + image.locator;
    }
    default:
      throw util::PersistenceFailure("image " + std::to_string(image.id) + " has no storage kind");
  }
}

ImageDescriptor VariantResolver::Describe(const ImageRecord& image) const {
  ImageDescriptor descriptor;
  descriptor.set_id(image.id);
  descriptor.set_storage_kind(image.storage_kind);
  descriptor.set_format(image.format);
  descriptor.mutable_size()->set_width(image.width);
  descriptor.mutable_size()->set_height(image.height);
  if (image.parent_id.has_value()) {
    descriptor.set_parent_id(*image.parent_id);
  }
  if (image.wanted_width.has_value() && image.wanted_height.has_value()) {
    descriptor.mutable_wanted()->set_width(*image.wanted_width);
    descriptor.mutable_wanted()->set_height(*image.wanted_height);
  }
  descriptor.set_locator(GetLocator(image));
  descriptor.set_created_at_ms(image.created_at_ms);
  return descriptor;
}

} // namespace imgvar::core

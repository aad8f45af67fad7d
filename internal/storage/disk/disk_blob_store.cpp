#include "disk_blob_store.hpp"

#include <arrow/io/file.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace imgvar::storage {

using namespace imgvar::storage::common;
using observability::StringField;

namespace {

std::atomic<uint64_t> g_write_seq{0};

// Writers racing on one locator (same size, same second) each get their own
// temp file; whichever rename lands last wins.
std::filesystem::path TmpPathFor(const std::filesystem::path& final_path) {
  return final_path.string() + ".tmp." + std::to_string(::getpid()) + "." + std::to_string(g_write_seq.fetch_add(1));
}

} // namespace

DiskBlobStore::DiskBlobStore(std::filesystem::path root)
    : root_(std::move(root)) {

  std::filesystem::create_directories(root_);
}

std::shared_ptr<arrow::Buffer> DiskBlobStore::Read(const std::string& locator) {

  auto path = BlobPath(root_, locator);
  if (!std::filesystem::is_regular_file(path)) {
    throw util::NotFound("no blob at " + locator);
  }

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

/*
  Atomic write:
      write tmp → flush → rename
*/
void DiskBlobStore::Write(const std::string& locator,
                          const std::shared_ptr<arrow::Buffer>& buffer,
                          bool fsync) {

  const auto final_path = BlobPath(root_, locator);
  const auto tmp_path   = TmpPathFor(final_path);

  try {
    std::filesystem::create_directories(final_path.parent_path());

    {
      auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
      Unwrap(out->Write(buffer->data(), buffer->size()));

      if (fsync)
        Unwrap(out->Flush());

      Unwrap(out->Close());
    }

    std::filesystem::rename(tmp_path, final_path);
  } catch (const std::exception& e) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    IMGVAR_LOG_ERROR("Blob write failed", {StringField("locator", locator), StringField("error", e.what())});
    throw util::StorageWriteFailure("writing " + final_path.string() + ": " + e.what());
  }
}

void DiskBlobStore::Remove(const std::string& locator) {
  std::filesystem::remove(BlobPath(root_, locator));
}

bool DiskBlobStore::Exists(const std::string& locator) {
  return std::filesystem::is_regular_file(BlobPath(root_, locator));
}

}

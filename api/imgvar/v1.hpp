#pragma once

#include "imgvar/v1/image.pb.h"

namespace imgvar::v1 {

inline bool IsKnownFormat(ImageFormat format) {
  return format == IMAGE_FORMAT_PNG || format == IMAGE_FORMAT_GIF || format == IMAGE_FORMAT_JPEG;
}

inline bool IsKnownStorageKind(StorageKind kind) {
  return kind == STORAGE_KIND_FILE_BACKED || kind == STORAGE_KIND_INLINE;
}

} // namespace imgvar::v1

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "imgvar/v1.hpp"

namespace imgvar::db::model {

/*
  Persistent image row.

  IMPORTANT:
  - Write-once. Nothing updates a record after InsertImage.
  - wanted_width/wanted_height are the cache key of a variant and are
    either both set or both unset. width/height are what was actually
    stored.
  - parent_id is a provenance back-reference, not ownership.
*/

struct ImageRecord {
  int64_t id = 0;

  imgvar::v1::StorageKind storage_kind = imgvar::v1::STORAGE_KIND_UNSPECIFIED;

  // Inline: base64 PNG payload. FileBacked: path relative to the uploads root.
  std::string locator;

  int32_t width  = 0;
  int32_t height = 0;

  std::optional<int64_t> parent_id;
  std::optional<int32_t> wanted_width;
  std::optional<int32_t> wanted_height;

  imgvar::v1::ImageFormat format = imgvar::v1::IMAGE_FORMAT_UNSPECIFIED;

  uint64_t created_at_ms = 0;
};

inline bool operator==(const ImageRecord& a, const ImageRecord& b) {
  return a.id == b.id && a.storage_kind == b.storage_kind && a.locator == b.locator && a.width == b.width && a.height == b.height &&
         a.parent_id == b.parent_id && a.wanted_width == b.wanted_width && a.wanted_height == b.wanted_height && a.format == b.format &&
         a.created_at_ms == b.created_at_ms;
}

/*
  Variant match rule shared by the in-memory backend and the SQL text in
  sql_queries.hpp. A request can be satisfied by a child that lines up on
  either axis.
*/
inline bool MatchesVariantRequest(const ImageRecord& r, int32_t width, int32_t height) {
  if (!r.wanted_width.has_value() && (r.width == width || r.height == height)) {
    return true;
  }
  return r.wanted_width == width || r.wanted_height == height;
}

// Largest first: width DESC, then height DESC.
inline bool VariantOrderBefore(const ImageRecord& a, const ImageRecord& b) {
  if (a.width != b.width) return a.width > b.width;
  return a.height > b.height;
}

// Fallible decoding of stored enum codes. Unknown codes yield nullopt.
inline std::optional<imgvar::v1::ImageFormat> FormatFromCode(int code) {
  if (!imgvar::v1::ImageFormat_IsValid(code)) return std::nullopt;
  const auto format = static_cast<imgvar::v1::ImageFormat>(code);
  if (!imgvar::v1::IsKnownFormat(format)) return std::nullopt;
  return format;
}

inline std::optional<imgvar::v1::StorageKind> StorageKindFromCode(int code) {
  if (!imgvar::v1::StorageKind_IsValid(code)) return std::nullopt;
  const auto kind = static_cast<imgvar::v1::StorageKind>(code);
  if (!imgvar::v1::IsKnownStorageKind(kind)) return std::nullopt;
  return kind;
}

} // namespace imgvar::db::model

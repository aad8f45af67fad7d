#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace imgvar::storage::common {

/*
  Locators are relative paths that must stay below the store root.
*/
inline void ValidateLocator(const std::string& locator) {
  if (locator.empty()) {
    throw std::invalid_argument("locator must not be empty");
  }
  if (locator.find('\0') != std::string::npos || locator.find('\\') != std::string::npos) {
    throw std::invalid_argument("locator contains invalid character");
  }

  const std::filesystem::path path(locator);
  if (path.is_absolute() || path.has_root_name()) {
    throw std::invalid_argument("locator must be relative: " + locator);
  }
  for (const auto& part : path) {
    if (part == "..") {
      throw std::invalid_argument("locator must not escape the store root: " + locator);
    }
  }
}

inline std::filesystem::path BlobPath(const std::filesystem::path& root, const std::string& locator) {
  ValidateLocator(locator);
  return root / locator;
}

} // namespace imgvar::storage::common

#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

#include "imgvar/v1.hpp"

namespace imgvar::cli {

// "png", ".PNG", "jpg", ... Nothing for anything else.
inline std::optional<imgvar::v1::ImageFormat> ParseFormat(std::string value) {
  for (auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (!value.empty() && value.front() == '.') value.erase(0, 1);

  if (value == "png") return imgvar::v1::IMAGE_FORMAT_PNG;
  if (value == "gif") return imgvar::v1::IMAGE_FORMAT_GIF;
  if (value == "jpeg" || value == "jpg") return imgvar::v1::IMAGE_FORMAT_JPEG;
  return std::nullopt;
}

// The whole argument must be the number; "12abc" and " 12" are rejected.
template <typename Int>
Int ParseWhole(const std::string& arg, const char* what) {
  Int        value{};
  const auto last      = arg.data() + arg.size();
  const auto [ptr, ec] = std::from_chars(arg.data(), last, value);
  if (arg.empty() || ec != std::errc() || ptr != last) {
    throw std::invalid_argument(std::string("invalid ") + what + ": '" + arg + "'");
  }
  return value;
}

inline int64_t ParseId(const std::string& arg) {
  return ParseWhole<int64_t>(arg, "image id");
}

inline int32_t ParseDimension(const std::string& arg) {
  return ParseWhole<int32_t>(arg, "dimension");
}

} // namespace imgvar::cli

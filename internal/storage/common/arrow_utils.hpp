#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace imgvar::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

// Owning copy of raw bytes, e.g. a codec's output blob.
inline std::shared_ptr<arrow::Buffer> CopyToBuffer(const void* data, size_t size) {
  auto result = arrow::AllocateBuffer(static_cast<int64_t>(size));
  if (!result.ok()) throw std::runtime_error(result.status().ToString());

  std::shared_ptr<arrow::Buffer> buffer = std::move(*result);
  if (size > 0) std::memcpy(buffer->mutable_data(), data, size);
  return buffer;
}

inline std::shared_ptr<arrow::Buffer> BufferFromString(std::string bytes) {
  return arrow::Buffer::FromString(std::move(bytes));
}

} // namespace imgvar::storage::common

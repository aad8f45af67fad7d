#pragma once

#include <stdexcept>
#include <string>

namespace imgvar::util {

/*
  Central error types.

  Everything the resolver can fail with is an ImageError; kind() tells
  callers which stage failed without string matching.
*/

enum class ErrorKind {
  DecodeFailure,
  EncodeFailure,
  StorageWriteFailure,
  PersistenceFailure,
  NotFound,
};

inline const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::DecodeFailure:
      return "decode_failure";
    case ErrorKind::EncodeFailure:
      return "encode_failure";
    case ErrorKind::StorageWriteFailure:
      return "storage_write_failure";
    case ErrorKind::PersistenceFailure:
      return "persistence_failure";
    case ErrorKind::NotFound:
      return "not_found";
  }
  return "unknown";
}

class ImageError : public std::runtime_error {
 public:
  ImageError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// Source bytes are malformed or unreadable.
class DecodeFailure : public ImageError {
 public:
  explicit DecodeFailure(const std::string& msg) : ImageError(ErrorKind::DecodeFailure, msg) {
  }
};

class EncodeFailure : public ImageError {
 public:
  explicit EncodeFailure(const std::string& msg) : ImageError(ErrorKind::EncodeFailure, msg) {
  }
};

class StorageWriteFailure : public ImageError {
 public:
  explicit StorageWriteFailure(const std::string& msg) : ImageError(ErrorKind::StorageWriteFailure, msg) {
  }
};

// Insert/query error or a corrupted row.
class PersistenceFailure : public ImageError {
 public:
  explicit PersistenceFailure(const std::string& msg) : ImageError(ErrorKind::PersistenceFailure, msg) {
  }
};

class NotFound : public ImageError {
 public:
  explicit NotFound(const std::string& msg) : ImageError(ErrorKind::NotFound, msg) {
  }
};

} // namespace imgvar::util

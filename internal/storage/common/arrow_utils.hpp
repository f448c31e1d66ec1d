#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace stowage::storage::common {

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
inline arrow::Result<std::shared_ptr<arrow::Buffer>> ReadAll(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  ARROW_ASSIGN_OR_RAISE(auto size, file->GetSize());
  return file->ReadAt(0, size);
}

/*
  Translate an Arrow status into the core taxonomy.

  IOError covers network, timeout and server-side failures for remote
  filesystems, so it is treated as retryable.
*/
util::Status ToStatus(const arrow::Status& status);

template <typename T>
util::StatusOr<T> ToStatusOr(arrow::Result<T> result) {
  if (!result.ok()) return ToStatus(result.status());
  return std::move(result).ValueOrDie();
}

/*
  Read exactly `length` bytes at `offset`; short reads are reported as
  InvalidArgument since the source no longer matches its declared size.
*/
util::StatusOr<std::shared_ptr<arrow::Buffer>> ReadExact(arrow::io::RandomAccessFile& source, uint64_t offset, uint64_t length);

// Content fingerprint used as etag by stores that do not issue their own.
std::string ContentTag(const std::shared_ptr<arrow::Buffer>& bytes);

/*
  Resolve a filesystem from a URI (s3://bucket/prefix, file:///x) or a
  plain local path. Returns the filesystem and the root path inside it.
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& root_path);

} // namespace stowage::storage::common

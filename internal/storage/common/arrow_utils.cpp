#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>

#include <filesystem>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace stowage::storage::common {

util::Status ToStatus(const arrow::Status& status) {
  if (status.ok()) {
    return util::Status::Ok();
  }
  if (status.IsIOError() || status.IsCancelled()) {
    return util::Status::Err(util::ErrorCode::Transient, status.ToString());
  }
  if (status.IsKeyError() || status.IsIndexError()) {
    return util::Status::Err(util::ErrorCode::NotFound, status.ToString());
  }
  if (status.IsInvalid() || status.IsTypeError() || status.IsNotImplemented()) {
    return util::Status::Err(util::ErrorCode::InvalidArgument, status.ToString());
  }
  return util::Status::Err(util::ErrorCode::Internal, status.ToString());
}

util::StatusOr<std::shared_ptr<arrow::Buffer>> ReadExact(arrow::io::RandomAccessFile& source, uint64_t offset, uint64_t length) {
  auto read = source.ReadAt(static_cast<int64_t>(offset), static_cast<int64_t>(length));
  if (!read.ok()) {
    return ToStatus(read.status());
  }

  auto buffer = std::move(read).ValueOrDie();
  if (static_cast<uint64_t>(buffer->size()) != length) {
    return util::Status::Err(util::ErrorCode::InvalidArgument, "short read from source: wanted " + std::to_string(length) + " bytes at offset " +
                                                                   std::to_string(offset) + ", got " + std::to_string(buffer->size()));
  }
  return buffer;
}

std::string ContentTag(const std::shared_ptr<arrow::Buffer>& bytes) {
  std::string_view view;
  if (bytes) {
    view = {reinterpret_cast<const char*>(bytes->data()), static_cast<size_t>(bytes->size())};
  }

  std::ostringstream out;
  out << std::hex << std::setw(16) << std::setfill('0') << std::hash<std::string_view>{}(view);
  return out.str();
}

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const std::string& root_path) {
  std::string resolved_path;
  if (root_path.find("://") == std::string::npos) {
    std::shared_ptr<arrow::fs::FileSystem> local = std::make_shared<arrow::fs::LocalFileSystem>();
    return std::make_pair(std::move(local), std::filesystem::absolute(root_path).lexically_normal().generic_string());
  }

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(root_path, &resolved_path));
  return std::make_pair(std::move(fs), resolved_path);
}

} // namespace stowage::storage::common

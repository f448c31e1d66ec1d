#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace stowage::storage::common {

/*
  Logical object keys: non-empty, '/'-separated, no empty, "." or ".."
  segments, no NUL, no leading '/'. Keys under the staging prefix are
  reserved for in-flight multipart parts.
*/
inline constexpr const char* kStagingPrefix = ".multipart";

inline util::Status ValidateObjectPath(const std::string& path) {
  if (path.empty()) {
    return util::Status::Err(util::ErrorCode::InvalidArgument, "object path must not be empty");
  }
  if (path.front() == '/' || path.back() == '/') {
    return util::Status::Err(util::ErrorCode::InvalidArgument, "object path must not start or end with '/': " + path);
  }

  std::string::size_type start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string::npos) end = path.size();

    const auto segment = path.substr(start, end - start);
    if (segment.empty() || segment == "." || segment == "..") {
      return util::Status::Err(util::ErrorCode::InvalidArgument, "object path has an invalid segment: " + path);
    }
    if (start == 0 && segment == kStagingPrefix) {
      return util::Status::Err(util::ErrorCode::InvalidArgument, "object path uses the reserved staging prefix: " + path);
    }
    start = end + 1;
  }

  for (char c : path) {
    if (c == '\0' || c == '\\') {
      return util::Status::Err(util::ErrorCode::InvalidArgument, "object path contains invalid character");
    }
  }
  return util::Status::Ok();
}

// Parent of a '/'-separated path; empty for a top-level entry.
inline std::string ParentOf(const std::string& path) {
  const auto pos = path.rfind('/');
  if (pos == std::string::npos || pos == 0) {
    return {};
  }
  return path.substr(0, pos);
}

inline std::string JoinPath(const std::string& root, const std::string& relative) {
  if (root.empty()) {
    return relative;
  }
  if (root.back() == '/') {
    return root + relative;
  }
  return root + "/" + relative;
}

} // namespace stowage::storage::common

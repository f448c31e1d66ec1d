#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace stowage::util {

/*
  Central error types.

  Every core operation reports failure through Status / StatusOr<T>.
  Exceptions are reserved for process-level failures (bad config,
  composition root) and never cross a core operation boundary.
*/

enum class ErrorCode {
  OK = 0,

  // Orchestration taxonomy
  InvalidChunkSize,
  InitiationError,
  PartUploadError,
  IncompletePartsError,
  CompletionError,
  LockTimeout,
  VersionConflict,
  CacheComputeError,

  // Collaborator / generic
  Transient,
  NotFound,
  InvalidArgument,
  InvalidState,
  Cancelled,
  Internal
};

std::string_view ToString(ErrorCode code);

// Store failures worth retrying locally: network, timeout, 5xx-equivalent.
constexpr bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Transient;
}

struct Status {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Status Ok() {
    return {};
  }

  static Status Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  bool ok() const {
    return code == ErrorCode::OK;
  }

  std::string ToString() const;
};

/*
  Value-or-error. Constructing from an OK status is a programming error
  and is reported as Internal rather than producing an empty value.
*/
template <typename T>
class StatusOr {
 public:
  StatusOr(T value) : value_(std::move(value)) {
  }

  StatusOr(Status status) : status_(std::move(status)) {
    if (status_.ok()) {
      status_ = Status::Err(ErrorCode::Internal, "StatusOr constructed from OK status without a value");
    }
  }

  bool ok() const {
    return status_.ok();
  }

  explicit operator bool() const {
    return ok();
  }

  const Status& status() const {
    return status_;
  }

  ErrorCode code() const {
    return status_.code;
  }

  T& value() & {
    return *value_;
  }

  const T& value() const& {
    return *value_;
  }

  T&& value() && {
    return std::move(*value_);
  }

  T* operator->() {
    return &*value_;
  }

  const T* operator->() const {
    return &*value_;
  }

  T& operator*() & {
    return *value_;
  }

  const T& operator*() const& {
    return *value_;
  }

 private:
  Status           status_;
  std::optional<T> value_;
};

inline const Status& StatusOf(const Status& status) {
  return status;
}

template <typename T>
const Status& StatusOf(const StatusOr<T>& result) {
  return result.status();
}

} // namespace stowage::util

#define STOWAGE_RETURN_IF_ERROR(expr)          \
  do {                                         \
    auto _stowage_status = (expr);             \
    if (!_stowage_status.ok()) {               \
      return _stowage_status;                  \
    }                                          \
  } while (0)

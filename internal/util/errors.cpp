#include "errors.hpp"

namespace stowage::util {

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::InvalidChunkSize:
      return "InvalidChunkSize";
    case ErrorCode::InitiationError:
      return "InitiationError";
    case ErrorCode::PartUploadError:
      return "PartUploadError";
    case ErrorCode::IncompletePartsError:
      return "IncompletePartsError";
    case ErrorCode::CompletionError:
      return "CompletionError";
    case ErrorCode::LockTimeout:
      return "LockTimeout";
    case ErrorCode::VersionConflict:
      return "VersionConflict";
    case ErrorCode::CacheComputeError:
      return "CacheComputeError";
    case ErrorCode::Transient:
      return "Transient";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::InvalidState:
      return "InvalidState";
    case ErrorCode::Cancelled:
      return "Cancelled";
    case ErrorCode::Internal:
      return "Internal";
  }
  return "Unknown";
}

std::string Status::ToString() const {
  std::string out(util::ToString(code));
  if (!message.empty()) {
    out += ": ";
    out += message;
  }
  return out;
}

} // namespace stowage::util

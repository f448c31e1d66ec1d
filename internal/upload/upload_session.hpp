#pragma once

#include <arrow/io/interfaces.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/upload/chunk_planner.hpp"

namespace stowage::upload {

enum class PartStatus : std::uint8_t {
  kPending   = 0,
  kInFlight  = 1,
  kCommitted = 2,
  kFailed    = 3,
};

enum class UploadState : std::uint8_t {
  kInitializing = 0,
  kUploading    = 1,
  kCompleting   = 2,
  kCompleted    = 3,
  kAborting     = 4,
  kAborted      = 5,
  kFailed       = 6,
};

std::string_view ToString(PartStatus status);
std::string_view ToString(UploadState state);

constexpr bool IsTerminal(UploadState state) {
  return state == UploadState::kCompleted || state == UploadState::kAborted;
}

/*
  Initializing → Uploading → Completing → Completed
  Initializing | Uploading | Failed → Aborting → Aborted
  any non-terminal → Failed

  Failed stops progress but still allows the abort that releases
  server-side parts.
*/
constexpr bool CanTransition(UploadState from, UploadState to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (to) {
    case UploadState::kInitializing:
      return false;
    case UploadState::kUploading:
      return from == UploadState::kInitializing;
    case UploadState::kCompleting:
      return from == UploadState::kUploading;
    case UploadState::kCompleted:
      return from == UploadState::kCompleting;
    case UploadState::kAborting:
      return from == UploadState::kInitializing || from == UploadState::kUploading || from == UploadState::kFailed ||
             from == UploadState::kAborting;
    case UploadState::kAborted:
      return from == UploadState::kAborting;
    case UploadState::kFailed:
      return from != UploadState::kAborting;
  }
  return false;
}

struct PartState {
  PartStatus                 status   = PartStatus::kPending;
  std::optional<std::string> etag;
  uint32_t                   attempts = 0;
};

class MultipartUploadCoordinator;

/*
  One in-flight multipart upload.

  Mutated only by the coordinator driving it; everything else reads
  through the locked accessors below, which return copies.
*/
class UploadSession {
 public:
  UploadSession(std::string session_id, std::string target_path, std::string content_type, uint64_t total_size, uint64_t chunk_size,
                std::vector<PartPlan> plan, std::shared_ptr<arrow::io::RandomAccessFile> source);

  UploadSession(const UploadSession&)            = delete;
  UploadSession& operator=(const UploadSession&) = delete;

  const std::string& SessionId() const {
    return session_id_;
  }

  const std::string& TargetPath() const {
    return target_path_;
  }

  const std::string& ContentType() const {
    return content_type_;
  }

  uint64_t TotalSize() const {
    return total_size_;
  }

  uint64_t ChunkSize() const {
    return chunk_size_;
  }

  uint32_t PartCount() const {
    return static_cast<uint32_t>(plan_.size());
  }

  const std::vector<PartPlan>& Plan() const {
    return plan_;
  }

  UploadState                   State() const;
  PartState                     Part(uint32_t sequence_number) const;
  std::map<uint32_t, PartState> Parts() const;
  bool                          AllCommitted() const;

 private:
  friend class MultipartUploadCoordinator;

  // caller holds mutex_
  bool TransitionLocked(UploadState to);
  bool AllCommittedLocked() const;

  const std::string                             session_id_;
  const std::string                             target_path_;
  const std::string                             content_type_;
  const uint64_t                                total_size_;
  const uint64_t                                chunk_size_;
  const std::vector<PartPlan>                   plan_;
  std::shared_ptr<arrow::io::RandomAccessFile> source_;

  mutable std::mutex            mutex_;
  UploadState                   state_ = UploadState::kInitializing;
  std::map<uint32_t, PartState> parts_;
};

} // namespace stowage::upload

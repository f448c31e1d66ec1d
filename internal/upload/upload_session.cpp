#include "upload_session.hpp"

namespace stowage::upload {

std::string_view ToString(PartStatus status) {
  switch (status) {
    case PartStatus::kPending:
      return "pending";
    case PartStatus::kInFlight:
      return "in_flight";
    case PartStatus::kCommitted:
      return "committed";
    case PartStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

std::string_view ToString(UploadState state) {
  switch (state) {
    case UploadState::kInitializing:
      return "initializing";
    case UploadState::kUploading:
      return "uploading";
    case UploadState::kCompleting:
      return "completing";
    case UploadState::kCompleted:
      return "completed";
    case UploadState::kAborting:
      return "aborting";
    case UploadState::kAborted:
      return "aborted";
    case UploadState::kFailed:
      return "failed";
  }
  return "unknown";
}

UploadSession::UploadSession(std::string session_id, std::string target_path, std::string content_type, uint64_t total_size, uint64_t chunk_size,
                             std::vector<PartPlan> plan, std::shared_ptr<arrow::io::RandomAccessFile> source)
    : session_id_(std::move(session_id)),
      target_path_(std::move(target_path)),
      content_type_(std::move(content_type)),
      total_size_(total_size),
      chunk_size_(chunk_size),
      plan_(std::move(plan)),
      source_(std::move(source)) {
  for (const auto& part : plan_) {
    parts_.emplace(part.sequence_number, PartState{});
  }
}

UploadState UploadSession::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

PartState UploadSession::Part(uint32_t sequence_number) const {
  std::lock_guard lock(mutex_);
  auto            it = parts_.find(sequence_number);
  return it == parts_.end() ? PartState{} : it->second;
}

std::map<uint32_t, PartState> UploadSession::Parts() const {
  std::lock_guard lock(mutex_);
  return parts_;
}

bool UploadSession::AllCommitted() const {
  std::lock_guard lock(mutex_);
  return AllCommittedLocked();
}

bool UploadSession::TransitionLocked(UploadState to) {
  if (!CanTransition(state_, to)) {
    return false;
  }
  state_ = to;
  return true;
}

bool UploadSession::AllCommittedLocked() const {
  for (const auto& [seq, part] : parts_) {
    if (part.status != PartStatus::kCommitted) return false;
  }
  return !parts_.empty();
}

} // namespace stowage::upload

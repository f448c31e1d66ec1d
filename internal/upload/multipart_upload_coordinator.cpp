#include "multipart_upload_coordinator.hpp"

#include <condition_variable>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace stowage::upload {

using observability::Event;
using observability::EventKind;
using observability::IntField;
using observability::StringField;
using util::ErrorCode;
using util::Status;

namespace {

/*
  Join point for parts running on an executor.
*/
struct PartTracker {
  std::mutex              mutex;
  std::condition_variable cv;
  std::size_t             remaining = 0;
  Status                  first_error;

  void Finish(const Status& status) {
    std::lock_guard lock(mutex);
    if (!status.ok()) {
      // InvalidState / Cancelled from sibling parts are fallout of the first real failure
      bool replace = first_error.ok() || (first_error.code == ErrorCode::InvalidState && status.code != ErrorCode::InvalidState);
      if (replace) first_error = status;
    }
    if (--remaining == 0) cv.notify_all();
  }

  Status Wait() {
    std::unique_lock lock(mutex);
    cv.wait(lock, [this] { return remaining == 0; });
    return first_error;
  }
};

} // namespace

MultipartUploadCoordinator::MultipartUploadCoordinator(storage::ObjectStoreClientPtr store, observability::EventSinkPtr events, CoordinatorOptions options)
    : store_(std::move(store)),
      events_(observability::OrNullSink(std::move(events))),
      options_(options),
      planner_(options.min_part_size, options.max_parts) {
  if (!store_) throw std::invalid_argument("MultipartUploadCoordinator: object store is required");
  if (options_.retry.max_attempts == 0) options_.retry.max_attempts = 1;
}

template <typename Call>
auto MultipartUploadCoordinator::RetryTransient(Call&& call) -> decltype(call()) {
  for (uint32_t attempt = 1;; ++attempt) {
    auto result = call();
    if (result.ok() || !util::IsTransient(util::StatusOf(result).code) || attempt >= options_.retry.max_attempts) {
      return result;
    }
    std::this_thread::sleep_for(options_.retry.BackoffAfter(attempt));
  }
}

// ---------------------------------------------------------------------------
// Start
// ---------------------------------------------------------------------------

util::StatusOr<std::unique_ptr<UploadSession>> MultipartUploadCoordinator::StartUpload(std::shared_ptr<arrow::io::RandomAccessFile> source,
                                                                                       const std::string& target_path, uint64_t chunk_size,
                                                                                       const std::string& content_type) {
  observability::SpanScope span("stowage.upload.start");
  span.SetAttribute("path", target_path);

  if (!source) {
    return Status::Err(ErrorCode::InvalidArgument, "upload source is required");
  }

  auto size = storage::common::ToStatusOr(source->GetSize());
  if (!size.ok()) {
    return Status::Err(ErrorCode::InvalidArgument, "cannot size upload source: " + size.status().message);
  }
  if (*size < 0) {
    return Status::Err(ErrorCode::InvalidArgument, "upload source reports negative size");
  }
  const auto total_size = static_cast<uint64_t>(*size);

  auto plan = planner_.Plan(total_size, chunk_size);
  if (!plan.ok()) {
    span.RecordError(plan.status().message);
    return plan.status();
  }

  auto session_id = RetryTransient([&] { return store_->InitiateMultipart(target_path, content_type, options_.store_call_timeout); });
  if (!session_id.ok()) {
    span.RecordError(session_id.status().message);
    STOWAGE_LOG_ERROR("multipart initiation failed", {StringField("path", target_path), StringField("error", session_id.status().ToString())});
    return Status::Err(ErrorCode::InitiationError, "initiating multipart upload of " + target_path + ": " + session_id.status().ToString());
  }

  auto session = std::make_unique<UploadSession>(*session_id, target_path, content_type, total_size, chunk_size, std::move(plan).value(), std::move(source));
  {
    std::lock_guard lock(session->mutex_);
    session->TransitionLocked(UploadState::kUploading);
  }

  span.SetAttribute("session_id", session->SessionId());
  span.SetAttribute("parts", static_cast<std::int64_t>(session->PartCount()));
  STOWAGE_LOG_INFO("multipart upload started", {StringField("path", target_path), StringField("session_id", session->SessionId()),
                                                IntField("size_bytes", static_cast<std::int64_t>(total_size)),
                                                IntField("parts", session->PartCount())});
  return std::move(session);
}

// ---------------------------------------------------------------------------
// Parts
// ---------------------------------------------------------------------------

void MultipartUploadCoordinator::FailPartLocked(UploadSession& session, PartState& part, uint32_t sequence_number, const Status& cause) {
  part.status = PartStatus::kFailed;
  session.TransitionLocked(UploadState::kFailed);

  events_->Emit(Event{EventKind::kPartFailed,
                      session.target_path_,
                      {{"session_id", session.session_id_},
                       {"part", std::to_string(sequence_number)},
                       {"attempts", std::to_string(part.attempts)},
                       {"error", cause.ToString()}}});
}

Status MultipartUploadCoordinator::UploadPart(UploadSession& session, const PartPlan& part, const util::CancellationToken& cancel) {
  const uint32_t seq = part.sequence_number;

  {
    std::lock_guard lock(session.mutex_);
    if (session.state_ != UploadState::kUploading) {
      return Status::Err(ErrorCode::InvalidState,
                         "session " + session.session_id_ + " is " + std::string(ToString(session.state_)) + ", parts are not accepted");
    }

    auto it = session.parts_.find(seq);
    if (it == session.parts_.end()) {
      return Status::Err(ErrorCode::InvalidArgument, "part " + std::to_string(seq) + " is not in the plan");
    }
    const auto& planned = session.plan_[seq - 1];
    if (planned.byte_offset != part.byte_offset || planned.byte_length != part.byte_length) {
      return Status::Err(ErrorCode::InvalidArgument, "part " + std::to_string(seq) + " does not match the session plan");
    }

    auto& state = it->second;
    if (state.status == PartStatus::kCommitted) return Status::Ok();
    if (state.status == PartStatus::kInFlight) {
      return Status::Err(ErrorCode::InvalidState, "part " + std::to_string(seq) + " is already in flight");
    }
    state.status = PartStatus::kInFlight;
  }

  observability::SpanScope span("stowage.upload.part");
  span.SetAttribute("session_id", session.session_id_);
  span.SetAttribute("part", static_cast<std::int64_t>(seq));

  auto bytes = storage::common::ReadExact(*session.source_, part.byte_offset, part.byte_length);
  if (!bytes.ok()) {
    std::lock_guard lock(session.mutex_);
    auto&           state = session.parts_[seq];
    FailPartLocked(session, state, seq, bytes.status());
    span.RecordError(bytes.status().message);
    return Status::Err(ErrorCode::PartUploadError, "reading part " + std::to_string(seq) + ": " + bytes.status().ToString());
  }

  while (true) {
    uint32_t attempt = 0;
    {
      std::lock_guard lock(session.mutex_);
      auto&           state = session.parts_[seq];
      if (cancel.IsCancelled()) {
        state.status = PartStatus::kPending;
        return Status::Err(ErrorCode::Cancelled, "upload cancelled");
      }
      if (session.state_ != UploadState::kUploading) {
        state.status = PartStatus::kPending;
        return Status::Err(ErrorCode::InvalidState, "session " + session.session_id_ + " left uploading state");
      }
      attempt = ++state.attempts;
    }

    auto etag = store_->UploadPart(session.session_id_, seq, *bytes, options_.store_call_timeout);
    observability::Metrics::Instance().RecordPartUpload(etag.ok());

    if (etag.ok()) {
      std::lock_guard lock(session.mutex_);
      auto&           state = session.parts_[seq];
      state.status          = PartStatus::kCommitted;
      state.etag            = std::move(etag).value();
      STOWAGE_LOG_DEBUG("part committed", {StringField("session_id", session.session_id_), IntField("part", seq), IntField("attempts", attempt)});
      return Status::Ok();
    }

    const auto& cause = etag.status();
    if (util::IsTransient(cause.code) && attempt < options_.retry.max_attempts) {
      auto delay = options_.retry.BackoffAfter(attempt);
      events_->Emit(Event{EventKind::kPartRetried,
                          session.target_path_,
                          {{"session_id", session.session_id_},
                           {"part", std::to_string(seq)},
                           {"attempt", std::to_string(attempt)},
                           {"backoff_ms", std::to_string(delay.count())},
                           {"error", cause.ToString()}}});
      if (!cancel.SleepFor(delay)) {
        std::lock_guard lock(session.mutex_);
        session.parts_[seq].status = PartStatus::kPending;
        return Status::Err(ErrorCode::Cancelled, "upload cancelled");
      }
      continue;
    }

    std::lock_guard lock(session.mutex_);
    FailPartLocked(session, session.parts_[seq], seq, cause);
    span.RecordError(cause.message);
    return Status::Err(ErrorCode::PartUploadError,
                       "part " + std::to_string(seq) + " failed after " + std::to_string(attempt) + " attempt(s): " + cause.ToString());
  }
}

Status MultipartUploadCoordinator::UploadParts(UploadSession& session, executor::TaskExecutor& executor, const util::CancellationToken& cancel) {
  std::vector<PartPlan> pending;
  {
    std::lock_guard lock(session.mutex_);
    for (const auto& part : session.plan_) {
      if (session.parts_[part.sequence_number].status != PartStatus::kCommitted) pending.push_back(part);
    }
  }
  if (pending.empty()) return Status::Ok();

  auto tracker       = std::make_shared<PartTracker>();
  tracker->remaining = pending.size();

  // every task finishes before Wait returns, so capturing `session` by reference is safe
  for (const auto& part : pending) {
    bool accepted = executor.Submit([this, &session, part, cancel, tracker] {
      Status status;
      try {
        status = UploadPart(session, part, cancel);
      } catch (const std::exception& e) {
        status = Status::Err(ErrorCode::Internal, e.what());
      }
      tracker->Finish(status);
    });
    if (!accepted) {
      tracker->Finish(Status::Err(ErrorCode::Internal, "executor rejected part " + std::to_string(part.sequence_number)));
    }
  }

  return tracker->Wait();
}

// ---------------------------------------------------------------------------
// Complete / Abort
// ---------------------------------------------------------------------------

util::StatusOr<storage::ObjectDescriptor> MultipartUploadCoordinator::CompleteUpload(UploadSession& session) {
  observability::SpanScope span("stowage.upload.complete");
  span.SetAttribute("session_id", session.session_id_);

  std::vector<storage::PartTag> tags;
  {
    std::lock_guard lock(session.mutex_);
    const auto      state = session.state_;
    if (state == UploadState::kCompleted || state == UploadState::kAborted || state == UploadState::kAborting ||
        state == UploadState::kCompleting) {
      return Status::Err(ErrorCode::InvalidState, "session " + session.session_id_ + " is " + std::string(ToString(state)));
    }

    std::string missing;
    for (const auto& [seq, part] : session.parts_) {
      if (part.status == PartStatus::kCommitted) continue;
      if (!missing.empty()) missing += ",";
      missing += std::to_string(seq);
    }
    if (!missing.empty()) {
      return Status::Err(ErrorCode::IncompletePartsError, "parts not committed: " + missing);
    }

    if (!session.TransitionLocked(UploadState::kCompleting)) {
      return Status::Err(ErrorCode::InvalidState, "session " + session.session_id_ + " is " + std::string(ToString(state)));
    }

    tags.reserve(session.parts_.size());
    for (const auto& [seq, part] : session.parts_) {
      tags.push_back(storage::PartTag{seq, *part.etag});
    }
  }

  auto descriptor = store_->CompleteMultipart(session.session_id_, tags, options_.store_call_timeout);

  std::lock_guard lock(session.mutex_);
  if (!descriptor.ok()) {
    session.TransitionLocked(UploadState::kFailed);
    span.RecordError(descriptor.status().message);
    STOWAGE_LOG_ERROR("multipart completion failed",
                      {StringField("session_id", session.session_id_), StringField("error", descriptor.status().ToString())});
    return Status::Err(ErrorCode::CompletionError, "completing " + session.target_path_ + ": " + descriptor.status().ToString());
  }

  session.TransitionLocked(UploadState::kCompleted);
  events_->Emit(Event{EventKind::kUploadCompleted,
                      session.target_path_,
                      {{"session_id", session.session_id_},
                       {"parts", std::to_string(tags.size())},
                       {"size_bytes", std::to_string(session.total_size_)},
                       {"version_id", descriptor->version_id}}});
  return descriptor;
}

Status MultipartUploadCoordinator::AbortUpload(UploadSession& session) {
  {
    std::lock_guard lock(session.mutex_);
    switch (session.state_) {
      case UploadState::kAborted:
        return Status::Ok();
      case UploadState::kCompleted:
        return Status::Err(ErrorCode::InvalidState, "session " + session.session_id_ + " already completed");
      case UploadState::kCompleting:
        return Status::Err(ErrorCode::InvalidState, "session " + session.session_id_ + " is completing");
      default:
        break;
    }
    session.TransitionLocked(UploadState::kAborting);
  }

  observability::SpanScope span("stowage.upload.abort");
  span.SetAttribute("session_id", session.session_id_);

  auto status = RetryTransient([&] { return store_->AbortMultipart(session.session_id_, options_.store_call_timeout); });

  std::lock_guard lock(session.mutex_);
  if (!status.ok()) {
    // stays Aborting so the caller can retry
    span.RecordError(status.message);
    STOWAGE_LOG_ERROR("multipart abort failed", {StringField("session_id", session.session_id_), StringField("error", status.ToString())});
    return status;
  }

  if (session.TransitionLocked(UploadState::kAborted)) {
    events_->Emit(Event{EventKind::kUploadAborted, session.target_path_, {{"session_id", session.session_id_}}});
  }
  return Status::Ok();
}

} // namespace stowage::upload

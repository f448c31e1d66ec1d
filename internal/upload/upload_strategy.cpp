#include "upload_strategy.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace stowage::upload {

using observability::StringField;
using util::ErrorCode;
using util::Status;

namespace {

/*
  Shared multipart flow: start, upload every part, complete.
  Any failure after the session exists aborts it before returning.
*/
util::StatusOr<StrategyOutcome> RunSession(MultipartUploadCoordinator& coordinator, executor::TaskExecutor& executor, const UploadRequest& request) {
  if (request.cancel.IsCancelled()) {
    return Status::Err(ErrorCode::Cancelled, "upload cancelled");
  }

  auto started = coordinator.StartUpload(request.source, request.target_path, request.chunk_size, request.content_type);
  if (!started.ok()) return started.status();
  auto session = std::move(started).value();

  auto abort_with = [&](const Status& cause) -> Status {
    auto aborted = coordinator.AbortUpload(*session);
    if (!aborted.ok()) {
      STOWAGE_LOG_ERROR("abort after failed upload did not succeed",
                        {StringField("session_id", session->SessionId()), StringField("error", aborted.ToString())});
    }
    return cause;
  };

  auto uploaded = coordinator.UploadParts(*session, executor, request.cancel);
  if (!uploaded.ok()) return abort_with(uploaded);

  if (request.cancel.IsCancelled()) {
    return abort_with(Status::Err(ErrorCode::Cancelled, "upload cancelled"));
  }

  auto descriptor = coordinator.CompleteUpload(*session);
  if (!descriptor.ok()) return abort_with(descriptor.status());

  return StrategyOutcome{std::move(descriptor).value(), session->PartCount()};
}

bool HasPrefix(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.substr(0, prefix.size()) == prefix;
}

} // namespace

std::string_view ToString(UploadStrategy strategy) {
  switch (strategy) {
    case UploadStrategy::kDirect:
      return "direct";
    case UploadStrategy::kChunked:
      return "chunked";
    case UploadStrategy::kMultipart:
      return "multipart";
  }
  return "unknown";
}

UploadStrategy ClassifyUpload(uint64_t total_size, std::string_view content_type, const UploadThresholds& thresholds) {
  if (total_size <= thresholds.direct_max_bytes) return UploadStrategy::kDirect;
  if (total_size >= thresholds.multipart_min_bytes) return UploadStrategy::kMultipart;

  for (const auto& prefix : thresholds.parallel_content_prefixes) {
    if (!prefix.empty() && HasPrefix(content_type, prefix)) return UploadStrategy::kMultipart;
  }
  return UploadStrategy::kChunked;
}

// ---------------------------------------------------------------------------
// Direct
// ---------------------------------------------------------------------------

DirectUploadRunner::DirectUploadRunner(storage::ObjectStoreClientPtr store, RetryPolicy retry, std::chrono::milliseconds call_timeout)
    : store_(std::move(store)), retry_(retry), call_timeout_(call_timeout) {
  if (!store_) throw std::invalid_argument("DirectUploadRunner: object store is required");
  if (retry_.max_attempts == 0) retry_.max_attempts = 1;
}

util::StatusOr<StrategyOutcome> DirectUploadRunner::Run(const UploadRequest& request) {
  if (!request.source) {
    return Status::Err(ErrorCode::InvalidArgument, "upload source is required");
  }

  auto bytes = storage::common::ToStatusOr(storage::common::ReadAll(request.source));
  if (!bytes.ok()) return bytes.status();

  for (uint32_t attempt = 1;; ++attempt) {
    if (request.cancel.IsCancelled()) {
      return Status::Err(ErrorCode::Cancelled, "upload cancelled");
    }

    auto descriptor = store_->PutSingle(request.target_path, *bytes, request.content_type, call_timeout_);
    if (descriptor.ok()) {
      return StrategyOutcome{std::move(descriptor).value(), 1};
    }
    if (!util::IsTransient(descriptor.code()) || attempt >= retry_.max_attempts) {
      return descriptor.status();
    }
    if (!request.cancel.SleepFor(retry_.BackoffAfter(attempt))) {
      return Status::Err(ErrorCode::Cancelled, "upload cancelled");
    }
  }
}

// ---------------------------------------------------------------------------
// Chunked / Multipart
// ---------------------------------------------------------------------------

util::StatusOr<StrategyOutcome> ChunkedUploadRunner::Run(const UploadRequest& request) {
  executor::InlineExecutor inline_executor;
  return RunSession(coordinator_, inline_executor, request);
}

MultipartUploadRunner::MultipartUploadRunner(MultipartUploadCoordinator& coordinator, executor::TaskExecutorPtr executor)
    : coordinator_(coordinator), executor_(std::move(executor)) {
  if (!executor_) throw std::invalid_argument("MultipartUploadRunner: executor is required");
}

util::StatusOr<StrategyOutcome> MultipartUploadRunner::Run(const UploadRequest& request) {
  return RunSession(coordinator_, *executor_, request);
}

} // namespace stowage::upload

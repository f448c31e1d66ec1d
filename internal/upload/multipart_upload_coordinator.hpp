#pragma once

#include <arrow/io/interfaces.h>

#include <chrono>
#include <memory>
#include <string>

#include "internal/executor/task_executor.hpp"
#include "internal/observability/events.hpp"
#include "internal/storage/object_store_client.hpp"
#include "internal/upload/chunk_planner.hpp"
#include "internal/upload/retry_policy.hpp"
#include "internal/upload/upload_session.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace stowage::upload {

struct CoordinatorOptions {
  RetryPolicy               retry;
  std::chrono::milliseconds store_call_timeout{30000};
  uint64_t                  min_part_size = 0;
  uint32_t                  max_parts     = 0;
};

/*
  Drives the multipart upload state machine.

  Parts are uploaded independently (and may run concurrently on an
  executor); each retries transient store failures with bounded
  exponential backoff. Completion is only accepted once every part is
  committed, and the ordered sequence→etag list handed to the store is
  what fixes final byte order.

  Callers must invoke AbortUpload on any failure or cancellation so the
  store does not keep orphaned parts.
*/
class MultipartUploadCoordinator {
 public:
  MultipartUploadCoordinator(storage::ObjectStoreClientPtr store, observability::EventSinkPtr events, CoordinatorOptions options);

  util::StatusOr<std::unique_ptr<UploadSession>> StartUpload(std::shared_ptr<arrow::io::RandomAccessFile> source, const std::string& target_path,
                                                             uint64_t chunk_size, const std::string& content_type);

  util::Status UploadPart(UploadSession& session, const PartPlan& part, const util::CancellationToken& cancel = {});

  /*
    Submit every non-committed part to `executor` and wait for all of them.
    Returns the first failure that is not a consequence of an earlier one.
  */
  util::Status UploadParts(UploadSession& session, executor::TaskExecutor& executor, const util::CancellationToken& cancel = {});

  util::StatusOr<storage::ObjectDescriptor> CompleteUpload(UploadSession& session);

  util::Status AbortUpload(UploadSession& session);

  const ChunkPlanner& Planner() const {
    return planner_;
  }

  const CoordinatorOptions& Options() const {
    return options_;
  }

 private:
  template <typename Call>
  auto RetryTransient(Call&& call) -> decltype(call());

  void FailPartLocked(UploadSession& session, PartState& part, uint32_t sequence_number, const util::Status& cause);

  storage::ObjectStoreClientPtr store_;
  observability::EventSinkPtr   events_;
  CoordinatorOptions            options_;
  ChunkPlanner                  planner_;
};

} // namespace stowage::upload

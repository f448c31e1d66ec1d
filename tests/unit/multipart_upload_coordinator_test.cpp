#include "internal/upload/multipart_upload_coordinator.hpp"

#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/executor/worker_pool.hpp"
#include "internal/observability/events.hpp"
#include "internal/storage/memory/memory_object_store.hpp"

namespace {

using stowage::executor::InlineExecutor;
using stowage::executor::WorkerPool;
using stowage::observability::EventKind;
using stowage::observability::RecordingEventSink;
using stowage::storage::MemoryObjectStore;
using stowage::upload::CoordinatorOptions;
using stowage::upload::MultipartUploadCoordinator;
using stowage::upload::PartStatus;
using stowage::upload::UploadState;
using stowage::util::CancellationToken;
using stowage::util::ErrorCode;

constexpr uint64_t kMiB = 1024 * 1024;

std::string Pattern(uint64_t size) {
  std::string bytes(size, '\0');
  for (uint64_t i = 0; i < size; ++i) {
    bytes[i] = static_cast<char>('a' + (i * 7 + i / 4096) % 26);
  }
  return bytes;
}

std::shared_ptr<arrow::io::RandomAccessFile> Source(const std::string& bytes) {
  return std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString(bytes));
}

CoordinatorOptions FastOptions() {
  CoordinatorOptions options;
  options.retry.max_attempts    = 3;
  options.retry.initial_backoff = std::chrono::milliseconds(1);
  options.retry.max_backoff     = std::chrono::milliseconds(4);
  options.min_part_size         = 5 * kMiB;
  options.max_parts             = 10000;
  return options;
}

struct Fixture {
  std::shared_ptr<MemoryObjectStore>  store  = std::make_shared<MemoryObjectStore>();
  std::shared_ptr<RecordingEventSink> events = std::make_shared<RecordingEventSink>();
  MultipartUploadCoordinator          coordinator{store, events, FastOptions()};
};

void TestTwelveMiBUploadCompletesInThreeParts() {
  Fixture    f;
  const auto payload = Pattern(12 * kMiB);

  auto session = f.coordinator.StartUpload(Source(payload), "videos/clip.bin", 5 * kMiB, "application/octet-stream");
  assert(session.ok());
  auto& s = **session;
  assert(s.State() == UploadState::kUploading);
  assert(s.PartCount() == 3);

  InlineExecutor executor;
  assert(f.coordinator.UploadParts(s, executor).ok());
  assert(s.AllCommitted());
  for (const auto& [seq, part] : s.Parts()) {
    assert(part.status == PartStatus::kCommitted);
    assert(part.etag.has_value());
    assert(part.attempts == 1);
  }

  auto descriptor = f.coordinator.CompleteUpload(s);
  assert(descriptor.ok());
  assert(s.State() == UploadState::kCompleted);
  assert(descriptor->size_bytes == 12 * kMiB);

  auto stored = f.store->Get("videos/clip.bin", std::chrono::seconds(1));
  assert(stored.ok());
  assert((*stored)->ToString() == payload);
  assert(f.events->Count(EventKind::kUploadCompleted) == 1);
}

void TestPartFailureExhaustsRetriesAndFailsSession() {
  Fixture f;
  f.store->FailPart(2, 10);

  auto session = f.coordinator.StartUpload(Source(Pattern(12 * kMiB)), "videos/broken.bin", 5 * kMiB, "application/octet-stream");
  assert(session.ok());
  auto& s = **session;

  InlineExecutor executor;
  auto           status = f.coordinator.UploadParts(s, executor);
  assert(status.code == ErrorCode::PartUploadError);
  assert(s.State() == UploadState::kFailed);
  assert(s.Part(2).status == PartStatus::kFailed);
  assert(s.Part(2).attempts == 3);
  assert(f.store->PartUploadCount(2) == 3);
  assert(f.events->Count(EventKind::kPartFailed) == 1);
  assert(f.events->Count(EventKind::kPartRetried) == 2);

  // part 3 never reached the store once the session failed
  assert(f.store->PartUploadCount(3) == 0);

  assert(f.coordinator.AbortUpload(s).ok());
  assert(s.State() == UploadState::kAborted);
  assert(f.store->AbortCount() == 1);
  assert(f.store->OpenSessionCount() == 0);
  assert(!f.store->Exists("videos/broken.bin"));
}

void TestTransientFailureRecoversWithinAttemptLimit() {
  Fixture f;
  f.store->FailPart(1, 2);

  auto session = f.coordinator.StartUpload(Source(Pattern(6 * kMiB)), "a/b.bin", 5 * kMiB, "");
  assert(session.ok());
  auto& s = **session;

  assert(f.coordinator.UploadPart(s, s.Plan()[0]).ok());
  assert(s.Part(1).status == PartStatus::kCommitted);
  assert(s.Part(1).attempts == 3);
}

void TestPermanentFailureIsNotRetried() {
  Fixture f;
  f.store->FailPart(1, 1, ErrorCode::InvalidArgument);

  auto session = f.coordinator.StartUpload(Source(Pattern(6 * kMiB)), "a/c.bin", 5 * kMiB, "");
  assert(session.ok());
  auto& s = **session;

  assert(f.coordinator.UploadPart(s, s.Plan()[0]).code == ErrorCode::PartUploadError);
  assert(f.store->PartUploadCount(1) == 1);
  assert(s.State() == UploadState::kFailed);
}

void TestCompleteRejectsEveryIncompleteSubset() {
  Fixture f;
  auto    session = f.coordinator.StartUpload(Source(Pattern(12 * kMiB)), "a/d.bin", 5 * kMiB, "");
  assert(session.ok());
  auto& s = **session;

  assert(f.coordinator.CompleteUpload(s).code() == ErrorCode::IncompletePartsError);

  assert(f.coordinator.UploadPart(s, s.Plan()[0]).ok());
  assert(f.coordinator.CompleteUpload(s).code() == ErrorCode::IncompletePartsError);

  assert(f.coordinator.UploadPart(s, s.Plan()[2]).ok());
  assert(f.coordinator.CompleteUpload(s).code() == ErrorCode::IncompletePartsError);
  assert(s.State() == UploadState::kUploading);

  assert(f.coordinator.UploadPart(s, s.Plan()[1]).ok());
  assert(f.coordinator.CompleteUpload(s).ok());
}

void TestOutOfOrderPartsKeepSequenceOrder() {
  Fixture    f;
  const auto payload = Pattern(15 * kMiB + 3);

  auto session = f.coordinator.StartUpload(Source(payload), "a/order.bin", 5 * kMiB, "");
  assert(session.ok());
  auto& s = **session;

  for (auto index : {3, 1, 0, 2}) {
    assert(f.coordinator.UploadPart(s, s.Plan()[index]).ok());
  }
  assert(f.coordinator.CompleteUpload(s).ok());

  auto stored = f.store->Get("a/order.bin", std::chrono::seconds(1));
  assert(stored.ok());
  assert((*stored)->ToString() == payload);
}

void TestParallelPartsOnWorkerPool() {
  Fixture    f;
  const auto payload = Pattern(26 * kMiB);

  WorkerPool pool(4);
  pool.Start();

  auto session = f.coordinator.StartUpload(Source(payload), "a/parallel.bin", 5 * kMiB, "");
  assert(session.ok());
  auto& s = **session;

  assert(f.coordinator.UploadParts(s, pool).ok());
  assert(f.coordinator.CompleteUpload(s).ok());
  pool.Stop();

  auto stored = f.store->Get("a/parallel.bin", std::chrono::seconds(1));
  assert(stored.ok());
  assert((*stored)->ToString() == payload);
}

void TestInitiationFailure() {
  Fixture f;
  f.store->FailInitiate(1, ErrorCode::InvalidArgument);

  auto session = f.coordinator.StartUpload(Source(Pattern(6 * kMiB)), "a/e.bin", 5 * kMiB, "");
  assert(session.code() == ErrorCode::InitiationError);

  // transient initiation failures are retried
  f.store->FailInitiate(2, ErrorCode::Transient);
  assert(f.coordinator.StartUpload(Source(Pattern(6 * kMiB)), "a/e.bin", 5 * kMiB, "").ok());
}

void TestInvalidChunkSizeSurfacesBeforeInitiation() {
  Fixture f;
  auto    session = f.coordinator.StartUpload(Source(Pattern(12 * kMiB)), "a/f.bin", 1 * kMiB, "");
  assert(session.code() == ErrorCode::InvalidChunkSize);
  assert(f.store->OpenSessionCount() == 0);
}

void TestCompletionRejectionFailsSession() {
  Fixture f;
  f.store->FailComplete(1, ErrorCode::InvalidArgument);

  auto session = f.coordinator.StartUpload(Source(Pattern(6 * kMiB)), "a/g.bin", 5 * kMiB, "");
  assert(session.ok());
  auto& s = **session;

  InlineExecutor executor;
  assert(f.coordinator.UploadParts(s, executor).ok());
  assert(f.coordinator.CompleteUpload(s).code() == ErrorCode::CompletionError);
  assert(s.State() == UploadState::kFailed);
  assert(f.coordinator.AbortUpload(s).ok());
}

void TestAbortIsIdempotentAndFinal() {
  Fixture f;
  auto    session = f.coordinator.StartUpload(Source(Pattern(6 * kMiB)), "a/h.bin", 5 * kMiB, "");
  assert(session.ok());
  auto& s = **session;

  assert(f.coordinator.AbortUpload(s).ok());
  assert(f.coordinator.AbortUpload(s).ok());
  assert(f.store->AbortCount() == 1);
  assert(f.events->Count(EventKind::kUploadAborted) == 1);

  assert(f.coordinator.UploadPart(s, s.Plan()[0]).code == ErrorCode::InvalidState);
  assert(f.coordinator.CompleteUpload(s).code() == ErrorCode::InvalidState);
  assert(f.store->PartUploadCount() == 0);
}

void TestCancellationStopsBeforeStoreCall() {
  Fixture f;
  auto    session = f.coordinator.StartUpload(Source(Pattern(12 * kMiB)), "a/i.bin", 5 * kMiB, "");
  assert(session.ok());
  auto& s = **session;

  auto cancel = CancellationToken::Create();
  cancel.Cancel();

  InlineExecutor executor;
  assert(f.coordinator.UploadParts(s, executor, cancel).code == ErrorCode::Cancelled);
  assert(f.store->PartUploadCount() == 0);
  assert(s.Part(1).status == PartStatus::kPending);
  assert(f.coordinator.AbortUpload(s).ok());
}

void TestCommittedPartIsNotReuploaded() {
  Fixture f;
  auto    session = f.coordinator.StartUpload(Source(Pattern(6 * kMiB)), "a/j.bin", 5 * kMiB, "");
  assert(session.ok());
  auto& s = **session;

  assert(f.coordinator.UploadPart(s, s.Plan()[0]).ok());
  assert(f.coordinator.UploadPart(s, s.Plan()[0]).ok());
  assert(f.store->PartUploadCount(1) == 1);
}

} // namespace

int main() {
  TestTwelveMiBUploadCompletesInThreeParts();
  TestPartFailureExhaustsRetriesAndFailsSession();
  TestTransientFailureRecoversWithinAttemptLimit();
  TestPermanentFailureIsNotRetried();
  TestCompleteRejectsEveryIncompleteSubset();
  TestOutOfOrderPartsKeepSequenceOrder();
  TestParallelPartsOnWorkerPool();
  TestInitiationFailure();
  TestInvalidChunkSizeSurfacesBeforeInitiation();
  TestCompletionRejectionFailsSession();
  TestAbortIsIdempotentAndFinal();
  TestCancellationStopsBeforeStoreCall();
  TestCommittedPartIsNotReuploaded();

  std::cout << "stowage_unit_multipart_upload_coordinator: pass\n";
  return 0;
}

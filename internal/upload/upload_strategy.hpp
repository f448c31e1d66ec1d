#pragma once

#include <arrow/io/interfaces.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/executor/task_executor.hpp"
#include "internal/storage/object_store_client.hpp"
#include "internal/upload/multipart_upload_coordinator.hpp"
#include "internal/upload/retry_policy.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace stowage::upload {

enum class UploadStrategy : std::uint8_t {
  kDirect    = 0, // one PutSingle call
  kChunked   = 1, // multipart, parts uploaded one after another
  kMultipart = 2, // multipart, parts uploaded in parallel
};

std::string_view ToString(UploadStrategy strategy);

struct UploadThresholds {
  uint64_t direct_max_bytes    = 5ull << 20;
  uint64_t multipart_min_bytes = 64ull << 20;

  // Content types that skip the sequential path once they are too large for a direct put.
  std::vector<std::string> parallel_content_prefixes{"video/", "audio/"};
};

UploadStrategy ClassifyUpload(uint64_t total_size, std::string_view content_type, const UploadThresholds& thresholds);

struct UploadRequest {
  std::shared_ptr<arrow::io::RandomAccessFile> source;
  std::string                                  target_path;
  std::string                                  content_type;
  uint64_t                                     chunk_size = 0;
  util::CancellationToken                      cancel;
};

struct StrategyOutcome {
  storage::ObjectDescriptor descriptor;
  uint32_t                  part_count = 0;
};

/*
  One way of getting bytes into the store.

  Run either returns the stored object or an error after having released
  everything it created on the store side (multipart runners abort their
  session before returning).
*/
class UploadStrategyRunner {
 public:
  virtual ~UploadStrategyRunner() = default;

  virtual UploadStrategy Kind() const = 0;

  virtual util::StatusOr<StrategyOutcome> Run(const UploadRequest& request) = 0;
};

class DirectUploadRunner final : public UploadStrategyRunner {
 public:
  DirectUploadRunner(storage::ObjectStoreClientPtr store, RetryPolicy retry, std::chrono::milliseconds call_timeout);

  UploadStrategy Kind() const override {
    return UploadStrategy::kDirect;
  }

  util::StatusOr<StrategyOutcome> Run(const UploadRequest& request) override;

 private:
  storage::ObjectStoreClientPtr store_;
  RetryPolicy                   retry_;
  std::chrono::milliseconds     call_timeout_;
};

class ChunkedUploadRunner final : public UploadStrategyRunner {
 public:
  explicit ChunkedUploadRunner(MultipartUploadCoordinator& coordinator) : coordinator_(coordinator) {
  }

  UploadStrategy Kind() const override {
    return UploadStrategy::kChunked;
  }

  util::StatusOr<StrategyOutcome> Run(const UploadRequest& request) override;

 private:
  MultipartUploadCoordinator& coordinator_;
};

/*
  Parallel parts on `executor`. Run blocks until every part settles, so it
  must not itself be called from one of the executor's workers.
*/
class MultipartUploadRunner final : public UploadStrategyRunner {
 public:
  MultipartUploadRunner(MultipartUploadCoordinator& coordinator, executor::TaskExecutorPtr executor);

  UploadStrategy Kind() const override {
    return UploadStrategy::kMultipart;
  }

  util::StatusOr<StrategyOutcome> Run(const UploadRequest& request) override;

 private:
  MultipartUploadCoordinator& coordinator_;
  executor::TaskExecutorPtr   executor_;
};

} // namespace stowage::upload

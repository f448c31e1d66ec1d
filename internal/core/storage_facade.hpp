#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/cache/cache_index.hpp"
#include "internal/executor/task_executor.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/storage/object_store_client.hpp"
#include "internal/upload/multipart_upload_coordinator.hpp"
#include "internal/upload/upload_strategy.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"
#include "stowage/v1/metadata.pb.h"

namespace stowage::core {

// Caller-supplied identity of an uploaded file.
struct FileRecord {
  std::string file_id;
  std::string owner_id;
  std::string folder_id;
  std::string content_type; // empty → configured default
};

struct UploadResult {
  storage::ObjectDescriptor descriptor;
  // the store's version id for the path; unrelated to the "v<N>" stamps of ReadVersion / CompareAndSwapVersion
  lock::VersionStamp        version;
  upload::UploadStrategy    strategy   = upload::UploadStrategy::kDirect;
  uint32_t                  part_count = 0;
};

/*
  Durable-record collaborator, told about every successful upload.
*/
class PersistenceSink {
 public:
  virtual ~PersistenceSink() = default;

  virtual util::Status Persist(const stowage::v1::FileMetadata& record, const lock::VersionStamp& version) = 0;
};

using PersistenceSinkPtr = std::shared_ptr<PersistenceSink>;

struct FacadeOptions {
  uint64_t                  chunk_size = 8ull << 20;
  upload::UploadThresholds  thresholds;
  upload::RetryPolicy       direct_retry;
  std::chrono::milliseconds store_call_timeout{30000};
  std::chrono::milliseconds cache_ttl{60000};
  std::chrono::milliseconds lock_ttl{30000};
  std::chrono::milliseconds lock_max_wait{10000};
  std::string               default_content_type{"application/octet-stream"};
};

/*
  StorageFacade

  Entry point composing the upload state machine, the tag cache and the
  lock manager.

  Cache layout:
    "file:<path>"   FileMetadata   tags file, file:<id>, user:<owner>, folder:<folder>
    "meta:<path>"   FileMetadata   tags file, meta:<path>
    "quota:<owner>" QuotaUsage     tags quota:<owner>

  Uploads hold the exclusive lock on their path for the whole transfer;
  quota counters use versioned writes instead.
*/
class StorageFacade {
 public:
  StorageFacade(storage::ObjectStoreClientPtr store, std::shared_ptr<upload::MultipartUploadCoordinator> coordinator,
                std::shared_ptr<cache::CacheIndex> cache, std::shared_ptr<lock::LockManager> locks, executor::TaskExecutorPtr executor,
                FacadeOptions options, PersistenceSinkPtr persistence = nullptr);

  /*
    Lock `path`, pick a strategy from the source size and content type, and
    run it to completion. Failures after a multipart session exists abort
    it before returning; the lock is released on every path.
  */
  util::StatusOr<UploadResult> Upload(std::shared_ptr<arrow::io::RandomAccessFile> source, const std::string& path, const FileRecord& record,
                                      const util::CancellationToken& cancel = {});

  // Cached metadata; ownership fields are only known for files uploaded through this facade.
  util::StatusOr<stowage::v1::FileMetadata> Read(const std::string& path);

  util::StatusOr<storage::ObjectMetadata> Stat(const std::string& path);

  // Object bytes, straight from the store.
  util::StatusOr<std::shared_ptr<arrow::Buffer>> Fetch(const std::string& path);

  // Returns the number of cache keys dropped.
  std::size_t Invalidate(const std::string& file_id, const std::string& owner_id, const std::string& folder_id);

  template <typename Fn>
  auto WithExclusiveAccess(const std::string& path, Fn&& fn) {
    return locks_->WithExclusiveAccess(path, options_.lock_ttl, options_.lock_max_wait, std::forward<Fn>(fn));
  }

  // optimistic-write stamps; uploads do not advance them
  lock::VersionStamp                 ReadVersion(const std::string& path);
  util::StatusOr<lock::VersionStamp> CompareAndSwapVersion(const std::string& path, const lock::VersionStamp& expected, const lock::MutateFn& mutate);

  util::StatusOr<stowage::v1::QuotaUsage> ReadQuota(const std::string& owner_id);

  // One optimistic attempt; VersionConflict is returned to the caller, not retried.
  util::StatusOr<stowage::v1::QuotaUsage> UpdateQuota(const std::string& owner_id, int64_t delta_bytes);

  const FacadeOptions& Options() const {
    return options_;
  }

  static std::string FileKey(const std::string& path) {
    return "file:" + path;
  }

  static std::string MetaKey(const std::string& path) {
    return "meta:" + path;
  }

  static std::string QuotaKey(const std::string& owner_id) {
    return "quota:" + owner_id;
  }

 private:
  upload::UploadStrategyRunner& RunnerFor(upload::UploadStrategy strategy);

  storage::ObjectStoreClientPtr                       store_;
  std::shared_ptr<upload::MultipartUploadCoordinator> coordinator_;
  std::shared_ptr<cache::CacheIndex>                  cache_;
  std::shared_ptr<lock::LockManager>                  locks_;
  executor::TaskExecutorPtr                           executor_;
  FacadeOptions                                       options_;
  PersistenceSinkPtr                                  persistence_;

  std::unique_ptr<upload::DirectUploadRunner>    direct_runner_;
  std::unique_ptr<upload::ChunkedUploadRunner>   chunked_runner_;
  std::unique_ptr<upload::MultipartUploadRunner> multipart_runner_;

  // quota counters; written only inside CompareAndSwap on "quota:<owner>"
  std::mutex                               quota_mutex_;
  std::unordered_map<std::string, int64_t> quota_bytes_;
};

} // namespace stowage::core

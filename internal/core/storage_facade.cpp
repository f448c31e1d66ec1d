#include "storage_facade.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/time.hpp"

namespace stowage::core {

using observability::IntField;
using observability::StringField;
using util::ErrorCode;
using util::Status;

namespace {

stowage::v1::FileMetadata FromObjectMetadata(const std::string& path, const storage::ObjectMetadata& meta) {
  stowage::v1::FileMetadata record;
  record.set_path(path);
  record.set_content_type(meta.content_type);
  record.set_size_bytes(meta.size_bytes);
  record.set_version_id(meta.version_id);
  record.set_updated_at_ms(util::WallUnixMillis());
  return record;
}

template <typename Message>
util::StatusOr<Message> Decode(const util::StatusOr<cache::CacheValue>& cached, const std::string& key) {
  if (!cached.ok()) return cached.status();

  Message message;
  if (!message.ParseFromString(*cached)) {
    return Status::Err(ErrorCode::Internal, "cache entry " + key + " is not a valid " + std::string(Message::descriptor()->full_name()));
  }
  return message;
}

util::StatusOr<cache::CacheValue> EncodeOrStatus(const util::StatusOr<storage::ObjectMetadata>& meta, const std::string& path) {
  if (!meta.ok()) return meta.status();
  return FromObjectMetadata(path, *meta).SerializeAsString();
}

} // namespace

StorageFacade::StorageFacade(storage::ObjectStoreClientPtr store, std::shared_ptr<upload::MultipartUploadCoordinator> coordinator,
                             std::shared_ptr<cache::CacheIndex> cache, std::shared_ptr<lock::LockManager> locks, executor::TaskExecutorPtr executor,
                             FacadeOptions options, PersistenceSinkPtr persistence)
    : store_(std::move(store)),
      coordinator_(std::move(coordinator)),
      cache_(std::move(cache)),
      locks_(std::move(locks)),
      executor_(std::move(executor)),
      options_(std::move(options)),
      persistence_(std::move(persistence)) {
  if (!store_ || !coordinator_ || !cache_ || !locks_ || !executor_) {
    throw std::invalid_argument("StorageFacade: store, coordinator, cache, locks and executor are required");
  }

  direct_runner_    = std::make_unique<upload::DirectUploadRunner>(store_, options_.direct_retry, options_.store_call_timeout);
  chunked_runner_   = std::make_unique<upload::ChunkedUploadRunner>(*coordinator_);
  multipart_runner_ = std::make_unique<upload::MultipartUploadRunner>(*coordinator_, executor_);
}

upload::UploadStrategyRunner& StorageFacade::RunnerFor(upload::UploadStrategy strategy) {
  switch (strategy) {
    case upload::UploadStrategy::kDirect:
      return *direct_runner_;
    case upload::UploadStrategy::kChunked:
      return *chunked_runner_;
    case upload::UploadStrategy::kMultipart:
      return *multipart_runner_;
  }
  return *chunked_runner_;
}

// ------------------------------------------------------------
// Upload
// ------------------------------------------------------------

util::StatusOr<UploadResult> StorageFacade::Upload(std::shared_ptr<arrow::io::RandomAccessFile> source, const std::string& path,
                                                   const FileRecord& record, const util::CancellationToken& cancel) {
  STOWAGE_RETURN_IF_ERROR(storage::common::ValidateObjectPath(path));
  if (!source) {
    return Status::Err(ErrorCode::InvalidArgument, "upload source is required");
  }

  auto size = storage::common::ToStatusOr(source->GetSize());
  if (!size.ok()) return size.status();

  const auto content_type = record.content_type.empty() ? options_.default_content_type : record.content_type;
  const auto strategy     = upload::ClassifyUpload(static_cast<uint64_t>(*size), content_type, options_.thresholds);

  observability::SpanScope span("stowage.facade.upload");
  span.SetAttribute("path", path);
  span.SetAttribute("strategy", upload::ToString(strategy));
  span.SetAttribute("size_bytes", static_cast<std::int64_t>(*size));

  const auto started = util::Now();

  auto result = locks_->WithExclusiveAccess(
      path, options_.lock_ttl, options_.lock_max_wait, [&](const lock::LockHandle&) -> util::StatusOr<UploadResult> {
        upload::UploadRequest request;
        request.source       = source;
        request.target_path  = path;
        request.content_type = content_type;
        request.chunk_size   = options_.chunk_size;
        request.cancel       = cancel;

        auto outcome = RunnerFor(strategy).Run(request);
        if (!outcome.ok()) return outcome.status();

        UploadResult uploaded;
        uploaded.descriptor = std::move(outcome->descriptor);
        uploaded.version    = lock::VersionStamp{path, uploaded.descriptor.version_id};
        uploaded.strategy   = strategy;
        uploaded.part_count = outcome->part_count;

        stowage::v1::FileMetadata meta;
        meta.set_path(path);
        meta.set_file_id(record.file_id);
        meta.set_owner_id(record.owner_id);
        meta.set_folder_id(record.folder_id);
        meta.set_content_type(uploaded.descriptor.content_type.empty() ? content_type : uploaded.descriptor.content_type);
        meta.set_size_bytes(uploaded.descriptor.size_bytes);
        meta.set_version_id(uploaded.descriptor.version_id);
        meta.set_etag(uploaded.descriptor.etag);
        meta.set_updated_at_ms(util::WallUnixMillis());

        cache::TagSet tags{"file"};
        if (!record.file_id.empty()) tags.insert("file:" + record.file_id);
        if (!record.owner_id.empty()) tags.insert("user:" + record.owner_id);
        if (!record.folder_id.empty()) tags.insert("folder:" + record.folder_id);

        cache_->InvalidateTag(MetaKey(path));
        cache_->Put(FileKey(path), meta.SerializeAsString(), tags, options_.cache_ttl);

        if (persistence_) {
          auto persisted = persistence_->Persist(meta, uploaded.version);
          if (!persisted.ok()) {
            STOWAGE_LOG_ERROR("persisting upload record failed", {StringField("path", path), StringField("error", persisted.ToString())});
            return persisted;
          }
        }
        return uploaded;
      });

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(util::Now() - started).count();
  observability::Metrics::Instance().ObserveUploadDurationMs(upload::ToString(strategy), elapsed_ms);

  if (!result.ok()) {
    span.RecordError(result.status().message);
    STOWAGE_LOG_WARN("upload failed", {StringField("path", path), StringField("strategy", upload::ToString(strategy)),
                                       StringField("error", result.status().ToString())});
    return result;
  }

  STOWAGE_LOG_INFO("upload completed", {StringField("path", path), StringField("strategy", upload::ToString(strategy)),
                                        StringField("version_id", result->descriptor.version_id),
                                        IntField("size_bytes", static_cast<std::int64_t>(result->descriptor.size_bytes)),
                                        IntField("parts", result->part_count)});
  return result;
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

util::StatusOr<stowage::v1::FileMetadata> StorageFacade::Read(const std::string& path) {
  STOWAGE_RETURN_IF_ERROR(storage::common::ValidateObjectPath(path));

  const auto key    = FileKey(path);
  auto       cached = cache_->GetOrCompute(key, {"file"}, options_.cache_ttl, [&]() -> util::StatusOr<cache::CacheValue> {
    return EncodeOrStatus(store_->GetMetadata(path, options_.store_call_timeout), path);
  });
  return Decode<stowage::v1::FileMetadata>(cached, key);
}

util::StatusOr<storage::ObjectMetadata> StorageFacade::Stat(const std::string& path) {
  STOWAGE_RETURN_IF_ERROR(storage::common::ValidateObjectPath(path));

  const auto key    = MetaKey(path);
  auto       cached = cache_->GetOrCompute(key, {"file", key}, options_.cache_ttl, [&]() -> util::StatusOr<cache::CacheValue> {
    return EncodeOrStatus(store_->GetMetadata(path, options_.store_call_timeout), path);
  });

  auto record = Decode<stowage::v1::FileMetadata>(cached, key);
  if (!record.ok()) return record.status();

  storage::ObjectMetadata meta;
  meta.version_id   = record->version_id();
  meta.size_bytes   = record->size_bytes();
  meta.content_type = record->content_type();
  return meta;
}

util::StatusOr<std::shared_ptr<arrow::Buffer>> StorageFacade::Fetch(const std::string& path) {
  STOWAGE_RETURN_IF_ERROR(storage::common::ValidateObjectPath(path));
  return store_->Get(path, options_.store_call_timeout);
}

std::size_t StorageFacade::Invalidate(const std::string& file_id, const std::string& owner_id, const std::string& folder_id) {
  std::size_t removed = 0;
  if (!file_id.empty()) removed += cache_->InvalidateTag("file:" + file_id);
  if (!owner_id.empty()) removed += cache_->InvalidateTag("user:" + owner_id);
  if (!folder_id.empty()) removed += cache_->InvalidateTag("folder:" + folder_id);
  return removed;
}

// ------------------------------------------------------------
// Versions / quotas
// ------------------------------------------------------------

lock::VersionStamp StorageFacade::ReadVersion(const std::string& path) {
  return locks_->ReadVersion(path);
}

util::StatusOr<lock::VersionStamp> StorageFacade::CompareAndSwapVersion(const std::string& path, const lock::VersionStamp& expected,
                                                                         const lock::MutateFn& mutate) {
  return locks_->CompareAndSwap(path, expected, mutate);
}

util::StatusOr<stowage::v1::QuotaUsage> StorageFacade::ReadQuota(const std::string& owner_id) {
  if (owner_id.empty()) {
    return Status::Err(ErrorCode::InvalidArgument, "owner id is empty");
  }

  const auto key    = QuotaKey(owner_id);
  auto       cached = cache_->GetOrCompute(key, {key}, options_.cache_ttl, [&]() -> util::StatusOr<cache::CacheValue> {
    stowage::v1::QuotaUsage usage;
    usage.set_owner_id(owner_id);
    {
      std::lock_guard lock(quota_mutex_);
      auto            it = quota_bytes_.find(owner_id);
      usage.set_used_bytes(it == quota_bytes_.end() ? 0 : it->second);
    }
    usage.set_version(locks_->ReadVersion(key).version);
    return usage.SerializeAsString();
  });
  return Decode<stowage::v1::QuotaUsage>(cached, key);
}

util::StatusOr<stowage::v1::QuotaUsage> StorageFacade::UpdateQuota(const std::string& owner_id, int64_t delta_bytes) {
  if (owner_id.empty()) {
    return Status::Err(ErrorCode::InvalidArgument, "owner id is empty");
  }

  const auto key      = QuotaKey(owner_id);
  const auto expected = locks_->ReadVersion(key);
  int64_t    used     = 0;

  auto stamp = locks_->CompareAndSwap(key, expected, [&]() -> Status {
    std::lock_guard lock(quota_mutex_);
    auto&           current = quota_bytes_[owner_id];
    if (current + delta_bytes < 0) {
      return Status::Err(ErrorCode::InvalidArgument, "quota for " + owner_id + " would become negative");
    }
    current += delta_bytes;
    used = current;
    return Status::Ok();
  });
  if (!stamp.ok()) return stamp.status();

  cache_->InvalidateTag(key);

  stowage::v1::QuotaUsage usage;
  usage.set_owner_id(owner_id);
  usage.set_used_bytes(used);
  usage.set_version(stamp->version);
  return usage;
}

} // namespace stowage::core

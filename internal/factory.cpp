#include "factory.hpp"

#include <chrono>
#include <memory>

#include "internal/lock/lock_table.hpp"
#include "internal/storage/storage_factory.hpp"

namespace stowage::factory {

using std::chrono::milliseconds;

namespace {

upload::RetryPolicy RetryPolicyFrom(const stowage::runtime::config::UploadConfig& upload) {
  upload::RetryPolicy retry;
  retry.max_attempts    = upload.max_part_attempts();
  retry.initial_backoff = milliseconds(upload.initial_backoff_ms());
  retry.max_backoff     = milliseconds(upload.max_backoff_ms());
  retry.multiplier      = upload.backoff_multiplier();
  retry.jitter          = upload.backoff_jitter();
  return retry;
}

} // namespace

upload::CoordinatorOptions CoordinatorOptionsFrom(const stowage::runtime::config::RuntimeConfig& config) {
  const auto& upload = config.upload();

  upload::CoordinatorOptions options;
  options.retry              = RetryPolicyFrom(upload);
  options.store_call_timeout = milliseconds(upload.store_call_timeout_ms());
  options.min_part_size      = upload.min_part_size_bytes();
  options.max_parts          = upload.max_parts();
  return options;
}

core::FacadeOptions FacadeOptionsFrom(const stowage::runtime::config::RuntimeConfig& config) {
  const auto& upload = config.upload();

  core::FacadeOptions options;
  options.chunk_size                     = upload.chunk_size_bytes();
  options.thresholds.direct_max_bytes    = upload.direct_upload_threshold_bytes();
  options.thresholds.multipart_min_bytes = upload.multipart_threshold_bytes();
  options.direct_retry                   = RetryPolicyFrom(upload);
  options.store_call_timeout             = milliseconds(upload.store_call_timeout_ms());
  options.default_content_type           = upload.default_content_type();
  options.cache_ttl                      = milliseconds(config.cache().default_ttl_ms());
  options.lock_ttl                       = milliseconds(config.locks().default_ttl_ms());
  options.lock_max_wait                  = milliseconds(config.locks().default_max_wait_ms());
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const stowage::runtime::config::RuntimeConfig& config, core::PersistenceSinkPtr persistence, observability::EventSinkPtr events) {
  Application app;
  app.events = events ? std::move(events) : std::make_shared<observability::LoggingEventSink>();

  // ------------------------------------------------------------------
  // Object store
  // ------------------------------------------------------------------
  app.store = storage::StorageFactory::Build(config.object_store());

  // ------------------------------------------------------------------
  // Workers
  // ------------------------------------------------------------------
  app.workers = std::make_shared<executor::WorkerPool>(config.workers().threads());
  app.workers->Start();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.coordinator = std::make_shared<upload::MultipartUploadCoordinator>(app.store, app.events, CoordinatorOptionsFrom(config));

  cache::CacheOptions cache_options;
  cache_options.default_ttl  = milliseconds(config.cache().default_ttl_ms());
  cache_options.compute_wait = milliseconds(config.cache().compute_wait_ms());
  app.cache                  = std::make_shared<cache::CacheIndex>(cache_options, app.events);

  lock::LockOptions lock_options;
  lock_options.default_ttl      = milliseconds(config.locks().default_ttl_ms());
  lock_options.default_max_wait = milliseconds(config.locks().default_max_wait_ms());
  lock_options.poll_interval    = milliseconds(config.locks().poll_interval_ms());
  app.locks                     = std::make_shared<lock::LockManager>(std::make_shared<lock::LockTable>(), lock_options, app.events);

  app.facade = std::make_shared<core::StorageFacade>(app.store, app.coordinator, app.cache, app.locks, app.workers, FacadeOptionsFrom(config),
                                                     std::move(persistence));
  return app;
}

} // namespace stowage::factory

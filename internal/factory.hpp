#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/cache_index.hpp"
#include "internal/core/storage_facade.hpp"
#include "internal/executor/worker_pool.hpp"
#include "internal/lock/lock_manager.hpp"
#include "internal/observability/events.hpp"
#include "internal/storage/object_store_client.hpp"
#include "internal/upload/multipart_upload_coordinator.hpp"

namespace stowage::factory {

/*
  Application

  Owns every long-lived component. Everything here lives for the
  lifetime of the process; `workers` is already started.
*/
struct Application {
  observability::EventSinkPtr                         events;
  storage::ObjectStoreClientPtr                       store;
  std::shared_ptr<executor::WorkerPool>               workers;
  std::shared_ptr<upload::MultipartUploadCoordinator> coordinator;
  std::shared_ptr<cache::CacheIndex>                  cache;
  std::shared_ptr<lock::LockManager>                  locks;
  std::shared_ptr<core::StorageFacade>                facade;
};

upload::CoordinatorOptions CoordinatorOptionsFrom(const stowage::runtime::config::RuntimeConfig& config);
core::FacadeOptions        FacadeOptionsFrom(const stowage::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete store and lock
  backend types. `config` is expected to have defaults applied.
*/
Application Build(const stowage::runtime::config::RuntimeConfig& config, core::PersistenceSinkPtr persistence = nullptr,
                  observability::EventSinkPtr events = nullptr);

} // namespace stowage::factory

#pragma once

#include "config/config.pb.h"
#include "internal/storage/object_store_client.hpp"

namespace stowage::storage {

/*
  Builds the object store client from configuration.

      memory      → MemoryObjectStore
      filesystem  → ArrowObjectStore over the resolved Arrow filesystem
*/
class StorageFactory {
 public:
  static ObjectStoreClientPtr Build(const stowage::runtime::config::ObjectStoreConfig& cfg);
};

} // namespace stowage::storage

#include "storage_factory.hpp"

#include <stdexcept>

#include "common/arrow_utils.hpp"
#include "memory/memory_object_store.hpp"
#include "object/arrow_object_store.hpp"

namespace stowage::storage {

ObjectStoreClientPtr StorageFactory::Build(const stowage::runtime::config::ObjectStoreConfig& cfg) {
  switch (cfg.backend_case()) {
    case stowage::runtime::config::ObjectStoreConfig::kFilesystem: {
      auto [fs, root] = common::Unwrap(common::ResolveFileSystem(cfg.filesystem().root_path()));
      common::Unwrap(fs->CreateDir(root, /*recursive=*/true));
      return std::make_shared<ArrowObjectStore>(std::move(fs), std::move(root));
    }
    case stowage::runtime::config::ObjectStoreConfig::kMemory:
    case stowage::runtime::config::ObjectStoreConfig::BACKEND_NOT_SET:
      return std::make_shared<MemoryObjectStore>();
  }
  throw std::runtime_error("unknown object store backend");
}

} // namespace stowage::storage

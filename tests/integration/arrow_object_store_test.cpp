#include "internal/storage/object/arrow_object_store.hpp"

#include <arrow/buffer.h>
#include <arrow/io/memory.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/events.hpp"
#include "internal/storage/storage_factory.hpp"

namespace {

using stowage::config::ConfigLoader;
using stowage::storage::ObjectStoreClientPtr;
using stowage::storage::PartTag;
using stowage::storage::StorageFactory;
using stowage::util::ErrorCode;

constexpr std::chrono::milliseconds kTimeout{5000};

std::filesystem::path FreshRoot(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "stowage_arrow_store_tests" / name;
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);
  return root;
}

ObjectStoreClientPtr BuildStore(const std::filesystem::path& root) {
  stowage::runtime::config::ObjectStoreConfig cfg;
  cfg.mutable_filesystem()->set_root_path(root.string());
  return StorageFactory::Build(cfg);
}

void TestPutAndGetRoundTripOnDisk() {
  const auto root  = FreshRoot("put_get");
  auto       store = BuildStore(root);

  auto put = store->PutSingle("docs/readme.txt", arrow::Buffer::FromString("on disk"), "text/plain", kTimeout);
  assert(put.ok());
  assert(put->size_bytes == 7);
  assert(!put->version_id.empty());
  assert(std::filesystem::exists(root / "docs" / "readme.txt"));

  auto meta = store->GetMetadata("docs/readme.txt", kTimeout);
  assert(meta.ok());
  assert(meta->size_bytes == 7);
  assert(meta->version_id == put->version_id);

  auto bytes = store->Get("docs/readme.txt", kTimeout);
  assert(bytes.ok());
  assert((*bytes)->ToString() == "on disk");

  assert(store->Get("docs/missing.txt", kTimeout).code() == ErrorCode::NotFound);
  assert(store->PutSingle("../escape", arrow::Buffer::FromString("x"), "", kTimeout).code() == ErrorCode::InvalidArgument);
}

void TestMultipartStagesAndAssembles() {
  const auto root  = FreshRoot("multipart");
  auto       store = BuildStore(root);

  auto session = store->InitiateMultipart("big/object.bin", "application/octet-stream", kTimeout);
  assert(session.ok());
  assert(std::filesystem::exists(root / ".multipart" / *session));

  auto tag3 = store->UploadPart(*session, 3, arrow::Buffer::FromString("c"), kTimeout);
  auto tag1 = store->UploadPart(*session, 1, arrow::Buffer::FromString("aa"), kTimeout);
  auto tag2 = store->UploadPart(*session, 2, arrow::Buffer::FromString("bbb"), kTimeout);
  assert(tag1.ok() && tag2.ok() && tag3.ok());

  assert(store->CompleteMultipart(*session, {PartTag{1, "stale"}}, kTimeout).code() == ErrorCode::InvalidArgument);

  auto done = store->CompleteMultipart(*session, {PartTag{1, *tag1}, PartTag{2, *tag2}, PartTag{3, *tag3}}, kTimeout);
  assert(done.ok());
  assert(done->size_bytes == 6);
  assert(!std::filesystem::exists(root / ".multipart" / *session));

  auto bytes = store->Get("big/object.bin", kTimeout);
  assert(bytes.ok());
  assert((*bytes)->ToString() == "aabbbc");
}

void TestAbortRemovesStagedParts() {
  const auto root  = FreshRoot("abort");
  auto       store = BuildStore(root);

  auto session = store->InitiateMultipart("big/object.bin", "", kTimeout);
  assert(session.ok());
  assert(store->UploadPart(*session, 1, arrow::Buffer::FromString("aa"), kTimeout).ok());

  assert(store->AbortMultipart(*session, kTimeout).ok());
  assert(!std::filesystem::exists(root / ".multipart" / *session));
  assert(store->UploadPart(*session, 2, arrow::Buffer::FromString("b"), kTimeout).code() == ErrorCode::NotFound);

  // second abort of the same session is a no-op
  assert(store->AbortMultipart(*session, kTimeout).ok());
  assert(store->AbortMultipart("not a session", kTimeout).code() == ErrorCode::InvalidArgument);
}

void TestApplicationOverFilesystemBackend() {
  const auto root   = FreshRoot("application");
  auto       config = ConfigLoader::Defaults();
  config.mutable_object_store()->mutable_filesystem()->set_root_path(root.string());
  config.mutable_workers()->set_threads(2);

  auto events = std::make_shared<stowage::observability::RecordingEventSink>();
  auto app    = stowage::factory::Build(config, nullptr, events);
  assert(app.facade);
  assert(app.workers->Threads() == 2);

  stowage::core::FileRecord record;
  record.file_id  = "f-9";
  record.owner_id = "u-9";

  auto source = std::make_shared<arrow::io::BufferReader>(arrow::Buffer::FromString("through the facade"));
  auto result = app.facade->Upload(source, "app/file.txt", record);
  assert(result.ok());
  assert(result->strategy == stowage::upload::UploadStrategy::kDirect);
  assert(std::filesystem::exists(root / "app" / "file.txt"));

  auto read = app.facade->Read("app/file.txt");
  assert(read.ok());
  assert(read->owner_id() == "u-9");
  assert(events->Count(stowage::observability::EventKind::kCacheHit) == 1);

  app.workers->Stop();
}

} // namespace

int main() {
  TestPutAndGetRoundTripOnDisk();
  TestMultipartStagesAndAssembles();
  TestAbortRemovesStagedParts();
  TestApplicationOverFilesystemBackend();

  std::cout << "stowage_integration_arrow_object_store: pass\n";
  return 0;
}

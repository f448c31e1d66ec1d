#pragma once

#include <arrow/buffer.h>
#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/object_store_client.hpp"

namespace stowage::storage {

/*
  Object store over an Arrow filesystem (local disk, S3 / MinIO).

  Object key layout:

      <root_path>/<object path>

  Multipart staging layout:

      <root_path>/.multipart/<session>/manifest      target path + content type
      <root_path>/.multipart/<session>/<seq>.part    one staged part

  Completion streams staged parts into the final object in sequence order
  and removes the staging directory. Call timeouts are enforced by the
  filesystem's own request timeout; a call that returns after its
  deadline is still reported as Transient.
*/
class ArrowObjectStore final : public ObjectStoreClient {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  util::StatusOr<std::string> InitiateMultipart(const std::string& path, const std::string& content_type, Timeout timeout) override;

  util::StatusOr<std::string> UploadPart(const std::string& session_id, uint32_t sequence_number, const std::shared_ptr<arrow::Buffer>& bytes,
                                         Timeout timeout) override;

  util::StatusOr<ObjectDescriptor> CompleteMultipart(const std::string& session_id, const std::vector<PartTag>& parts, Timeout timeout) override;

  util::Status AbortMultipart(const std::string& session_id, Timeout timeout) override;

  util::StatusOr<ObjectDescriptor> PutSingle(const std::string& path, const std::shared_ptr<arrow::Buffer>& bytes, const std::string& content_type,
                                             Timeout timeout) override;

  util::StatusOr<ObjectMetadata> GetMetadata(const std::string& path, Timeout timeout) override;

  util::StatusOr<std::shared_ptr<arrow::Buffer>> Get(const std::string& path, Timeout timeout) override;

 private:
  struct Manifest {
    std::string path;
    std::string content_type;
  };

  std::string ObjectPath(const std::string& path) const;
  std::string StagingDir(const std::string& session_id) const;
  std::string StagedPartPath(const std::string& session_id, uint32_t sequence_number) const;

  arrow::Result<Manifest>         ReadManifest(const std::string& session_id) const;
  arrow::Result<ObjectDescriptor> Describe(const std::string& path, const std::string& content_type) const;
  arrow::Status                   WriteObject(const std::string& full_path, const std::shared_ptr<arrow::Buffer>& bytes,
                                              const std::string& content_type) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace stowage::storage

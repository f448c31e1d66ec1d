#pragma once

#include <arrow/buffer.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace stowage::storage {

/*
  Capability wrapper over the remote object store.

  Every object is represented as an Arrow Buffer. Every call carries an
  explicit timeout; implementations report an exceeded deadline, network
  failure or 5xx-equivalent as ErrorCode::Transient so callers can retry.

  Implementations:
    MEMORY  → in-process map (tests, single-node runs)
    ARROW   → any arrow::fs::FileSystem (local, S3 / MinIO)
*/

struct ObjectDescriptor {
  std::string path;
  std::string version_id;
  std::string etag;
  std::string content_type;
  uint64_t    size_bytes = 0;
};

struct ObjectMetadata {
  std::string version_id;
  uint64_t    size_bytes = 0;
  std::string content_type;
};

// Store-issued tag for one committed part.
struct PartTag {
  uint32_t    sequence_number = 0;
  std::string etag;
};

class ObjectStoreClient {
 public:
  using Timeout = std::chrono::milliseconds;

  virtual ~ObjectStoreClient() = default;

  // ------------------------------------------------------------------
  // Multipart
  // ------------------------------------------------------------------
  virtual util::StatusOr<std::string> InitiateMultipart(const std::string& path, const std::string& content_type, Timeout timeout) = 0;

  virtual util::StatusOr<std::string> UploadPart(const std::string& session_id, uint32_t sequence_number,
                                                 const std::shared_ptr<arrow::Buffer>& bytes, Timeout timeout) = 0;

  /*
    Finalize. `parts` is ordered by sequence number; the store assembles
    bytes in that order regardless of the order parts arrived in.
  */
  virtual util::StatusOr<ObjectDescriptor> CompleteMultipart(const std::string& session_id, const std::vector<PartTag>& parts,
                                                             Timeout timeout) = 0;

  // Discards every staged part. Unknown sessions are not an error.
  virtual util::Status AbortMultipart(const std::string& session_id, Timeout timeout) = 0;

  // ------------------------------------------------------------------
  // Single shot
  // ------------------------------------------------------------------
  virtual util::StatusOr<ObjectDescriptor> PutSingle(const std::string& path, const std::shared_ptr<arrow::Buffer>& bytes,
                                                     const std::string& content_type, Timeout timeout) = 0;

  virtual util::StatusOr<ObjectMetadata> GetMetadata(const std::string& path, Timeout timeout) = 0;

  virtual util::StatusOr<std::shared_ptr<arrow::Buffer>> Get(const std::string& path, Timeout timeout) = 0;
};

using ObjectStoreClientPtr = std::shared_ptr<ObjectStoreClient>;

} // namespace stowage::storage

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/storage/object_store_client.hpp"

namespace stowage::storage {

/*
  In-process object store.

  Characteristics:
    - per-path monotonically increasing version ids
    - multipart sessions stage parts keyed by sequence number
    - completion concatenates staged parts in sequence order
    - fault injection for initiate / part / complete calls
    - optional per-call latency, checked against the call timeout
*/
class MemoryObjectStore final : public ObjectStoreClient {
 public:
  util::StatusOr<std::string> InitiateMultipart(const std::string& path, const std::string& content_type, Timeout timeout) override;

  util::StatusOr<std::string> UploadPart(const std::string& session_id, uint32_t sequence_number, const std::shared_ptr<arrow::Buffer>& bytes,
                                         Timeout timeout) override;

  util::StatusOr<ObjectDescriptor> CompleteMultipart(const std::string& session_id, const std::vector<PartTag>& parts, Timeout timeout) override;

  util::Status AbortMultipart(const std::string& session_id, Timeout timeout) override;

  util::StatusOr<ObjectDescriptor> PutSingle(const std::string& path, const std::shared_ptr<arrow::Buffer>& bytes, const std::string& content_type,
                                             Timeout timeout) override;

  util::StatusOr<ObjectMetadata> GetMetadata(const std::string& path, Timeout timeout) override;

  util::StatusOr<std::shared_ptr<arrow::Buffer>> Get(const std::string& path, Timeout timeout) override;

  // ------------------------------------------------------------------
  // Fault injection
  // ------------------------------------------------------------------
  // Fail the next `times` uploads of part `sequence_number` (any session).
  void FailPart(uint32_t sequence_number, uint32_t times, util::ErrorCode code = util::ErrorCode::Transient);
  void FailInitiate(uint32_t times, util::ErrorCode code);
  void FailComplete(uint32_t times, util::ErrorCode code);
  void SetLatency(std::chrono::milliseconds latency);

  // ------------------------------------------------------------------
  // Introspection
  // ------------------------------------------------------------------
  uint64_t    AbortCount() const;
  uint64_t    PartUploadCount() const;
  uint64_t    PartUploadCount(uint32_t sequence_number) const;
  std::size_t OpenSessionCount() const;
  bool        Exists(const std::string& path) const;

 private:
  struct StoredObject {
    std::shared_ptr<arrow::Buffer> bytes;
    std::string                    content_type;
    uint64_t                       version = 0;
    std::string                    etag;
  };

  struct Session {
    std::string                                         path;
    std::string                                         content_type;
    std::map<uint32_t, std::pair<std::string, std::shared_ptr<arrow::Buffer>>> parts; // seq -> (etag, bytes)
  };

  struct Fault {
    uint32_t        remaining = 0;
    util::ErrorCode code      = util::ErrorCode::Transient;
  };

  util::Status SimulateLatency(Timeout timeout) const;
  static bool  Consume(Fault& fault, util::Status* out, const std::string& what);

  ObjectDescriptor StoreLocked(const std::string& path, std::shared_ptr<arrow::Buffer> bytes, const std::string& content_type);

  mutable std::mutex mutex_;

  std::unordered_map<std::string, StoredObject> objects_;
  std::unordered_map<std::string, Session>      sessions_;

  std::unordered_map<uint32_t, Fault>    part_faults_;
  std::unordered_map<uint32_t, uint64_t> part_attempts_;
  Fault                                  initiate_fault_;
  Fault                                  complete_fault_;

  std::chrono::milliseconds latency_{0};
  uint64_t                  abort_count_       = 0;
  uint64_t                  part_upload_count_ = 0;
};

} // namespace stowage::storage

#include "memory_object_store.hpp"

#include <arrow/memory_pool.h>

#include <thread>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/uuid.hpp"

namespace stowage::storage {

using util::ErrorCode;
using util::Status;
using util::StatusOr;

Status MemoryObjectStore::SimulateLatency(Timeout timeout) const {
  std::chrono::milliseconds latency;
  {
    std::lock_guard lock(mutex_);
    latency = latency_;
  }
  if (latency.count() == 0) {
    return Status::Ok();
  }
  if (latency > timeout) {
    std::this_thread::sleep_for(timeout);
    return Status::Err(ErrorCode::Transient, "deadline exceeded after " + std::to_string(timeout.count()) + "ms");
  }
  std::this_thread::sleep_for(latency);
  return Status::Ok();
}

bool MemoryObjectStore::Consume(Fault& fault, Status* out, const std::string& what) {
  if (fault.remaining == 0) {
    return false;
  }
  --fault.remaining;
  *out = Status::Err(fault.code, "injected failure: " + what);
  return true;
}

ObjectDescriptor MemoryObjectStore::StoreLocked(const std::string& path, std::shared_ptr<arrow::Buffer> bytes, const std::string& content_type) {
  auto& object        = objects_[path];
  object.version     += 1;
  object.etag         = common::ContentTag(bytes);
  object.content_type = content_type;
  object.bytes        = std::move(bytes);

  ObjectDescriptor descriptor;
  descriptor.path         = path;
  descriptor.version_id   = std::to_string(object.version);
  descriptor.etag         = object.etag;
  descriptor.content_type = object.content_type;
  descriptor.size_bytes   = object.bytes ? static_cast<uint64_t>(object.bytes->size()) : 0;
  return descriptor;
}

// ------------------------------------------------------------
// Multipart
// ------------------------------------------------------------

StatusOr<std::string> MemoryObjectStore::InitiateMultipart(const std::string& path, const std::string& content_type, Timeout timeout) {
  STOWAGE_RETURN_IF_ERROR(common::ValidateObjectPath(path));
  STOWAGE_RETURN_IF_ERROR(SimulateLatency(timeout));

  std::lock_guard lock(mutex_);
  Status          injected;
  if (Consume(initiate_fault_, &injected, "initiate " + path)) {
    return injected;
  }

  auto     session_id = util::NewToken();
  Session& session    = sessions_[session_id];
  session.path         = path;
  session.content_type = content_type;
  return session_id;
}

StatusOr<std::string> MemoryObjectStore::UploadPart(const std::string& session_id, uint32_t sequence_number,
                                                    const std::shared_ptr<arrow::Buffer>& bytes, Timeout timeout) {
  {
    std::lock_guard lock(mutex_);
    ++part_upload_count_;
    ++part_attempts_[sequence_number];
  }

  STOWAGE_RETURN_IF_ERROR(SimulateLatency(timeout));

  std::lock_guard lock(mutex_);
  Status          injected;
  if (auto fault = part_faults_.find(sequence_number); fault != part_faults_.end()) {
    if (Consume(fault->second, &injected, "part " + std::to_string(sequence_number))) {
      return injected;
    }
  }

  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return Status::Err(ErrorCode::NotFound, "no such multipart session: " + session_id);
  }
  if (sequence_number == 0) {
    return Status::Err(ErrorCode::InvalidArgument, "part sequence numbers start at 1");
  }

  auto etag                          = common::ContentTag(bytes);
  it->second.parts[sequence_number] = {etag, bytes};
  return etag;
}

StatusOr<ObjectDescriptor> MemoryObjectStore::CompleteMultipart(const std::string& session_id, const std::vector<PartTag>& parts, Timeout timeout) {
  STOWAGE_RETURN_IF_ERROR(SimulateLatency(timeout));

  std::lock_guard lock(mutex_);
  Status          injected;
  if (Consume(complete_fault_, &injected, "complete " + session_id)) {
    return injected;
  }

  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return Status::Err(ErrorCode::NotFound, "no such multipart session: " + session_id);
  }
  if (parts.empty()) {
    return Status::Err(ErrorCode::InvalidArgument, "completion requires at least one part");
  }

  auto&                                       session = it->second;
  std::vector<std::shared_ptr<arrow::Buffer>> ordered;
  ordered.reserve(parts.size());
  uint32_t    previous = 0;
  std::string etag_input;
  for (const auto& part : parts) {
    if (part.sequence_number <= previous) {
      return Status::Err(ErrorCode::InvalidArgument, "parts must be listed in ascending sequence order");
    }
    previous = part.sequence_number;

    auto staged = session.parts.find(part.sequence_number);
    if (staged == session.parts.end() || staged->second.first != part.etag) {
      return Status::Err(ErrorCode::InvalidArgument, "part " + std::to_string(part.sequence_number) + " is missing or has a stale etag");
    }
    etag_input += staged->second.first;
    ordered.push_back(staged->second.second);
  }

  auto combined = arrow::ConcatenateBuffers(ordered, arrow::default_memory_pool());
  if (!combined.ok()) {
    return Status::Err(ErrorCode::Internal, combined.status().ToString());
  }

  auto descriptor = StoreLocked(session.path, std::move(combined).ValueOrDie(), session.content_type);
  descriptor.etag = common::ContentTag(arrow::Buffer::FromString(etag_input)) + "-" + std::to_string(parts.size());
  objects_[session.path].etag = descriptor.etag;
  sessions_.erase(it);
  return descriptor;
}

Status MemoryObjectStore::AbortMultipart(const std::string& session_id, Timeout timeout) {
  STOWAGE_RETURN_IF_ERROR(SimulateLatency(timeout));

  std::lock_guard lock(mutex_);
  ++abort_count_;
  sessions_.erase(session_id);
  return Status::Ok();
}

// ------------------------------------------------------------
// Single shot
// ------------------------------------------------------------

StatusOr<ObjectDescriptor> MemoryObjectStore::PutSingle(const std::string& path, const std::shared_ptr<arrow::Buffer>& bytes,
                                                        const std::string& content_type, Timeout timeout) {
  STOWAGE_RETURN_IF_ERROR(common::ValidateObjectPath(path));
  STOWAGE_RETURN_IF_ERROR(SimulateLatency(timeout));

  std::lock_guard lock(mutex_);
  return StoreLocked(path, bytes, content_type);
}

StatusOr<ObjectMetadata> MemoryObjectStore::GetMetadata(const std::string& path, Timeout timeout) {
  STOWAGE_RETURN_IF_ERROR(SimulateLatency(timeout));

  std::lock_guard lock(mutex_);
  auto            it = objects_.find(path);
  if (it == objects_.end()) {
    return Status::Err(ErrorCode::NotFound, "no such object: " + path);
  }

  ObjectMetadata metadata;
  metadata.version_id   = std::to_string(it->second.version);
  metadata.size_bytes   = it->second.bytes ? static_cast<uint64_t>(it->second.bytes->size()) : 0;
  metadata.content_type = it->second.content_type;
  return metadata;
}

StatusOr<std::shared_ptr<arrow::Buffer>> MemoryObjectStore::Get(const std::string& path, Timeout timeout) {
  STOWAGE_RETURN_IF_ERROR(SimulateLatency(timeout));

  std::lock_guard lock(mutex_);
  auto            it = objects_.find(path);
  if (it == objects_.end()) {
    return Status::Err(ErrorCode::NotFound, "no such object: " + path);
  }
  return it->second.bytes;
}

// ------------------------------------------------------------
// Fault injection / introspection
// ------------------------------------------------------------

void MemoryObjectStore::FailPart(uint32_t sequence_number, uint32_t times, ErrorCode code) {
  std::lock_guard lock(mutex_);
  part_faults_[sequence_number] = Fault{times, code};
}

void MemoryObjectStore::FailInitiate(uint32_t times, ErrorCode code) {
  std::lock_guard lock(mutex_);
  initiate_fault_ = Fault{times, code};
}

void MemoryObjectStore::FailComplete(uint32_t times, ErrorCode code) {
  std::lock_guard lock(mutex_);
  complete_fault_ = Fault{times, code};
}

void MemoryObjectStore::SetLatency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  latency_ = latency;
}

uint64_t MemoryObjectStore::AbortCount() const {
  std::lock_guard lock(mutex_);
  return abort_count_;
}

uint64_t MemoryObjectStore::PartUploadCount() const {
  std::lock_guard lock(mutex_);
  return part_upload_count_;
}

uint64_t MemoryObjectStore::PartUploadCount(uint32_t sequence_number) const {
  std::lock_guard lock(mutex_);
  auto            it = part_attempts_.find(sequence_number);
  return it == part_attempts_.end() ? 0 : it->second;
}

std::size_t MemoryObjectStore::OpenSessionCount() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

bool MemoryObjectStore::Exists(const std::string& path) const {
  std::lock_guard lock(mutex_);
  return objects_.count(path) > 0;
}

} // namespace stowage::storage

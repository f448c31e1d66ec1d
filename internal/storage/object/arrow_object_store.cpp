#include "arrow_object_store.hpp"

#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/util/key_value_metadata.h>

#include <cctype>
#include <sstream>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace stowage::storage {

using namespace stowage::storage::common;
using util::ErrorCode;
using util::Status;
using util::StatusOr;

namespace {

constexpr const char* kContentTypeKey     = "Content-Type";
constexpr const char* kDefaultContentType = "application/octet-stream";

/*
  Report a call that overran its deadline as Transient even if the
  filesystem eventually succeeded.
*/
class CallDeadline {
 public:
  explicit CallDeadline(ObjectStoreClient::Timeout timeout) : deadline_(util::DeadlineAfter(timeout)), timeout_(timeout) {
  }

  Status Check(const std::string& what) const {
    if (util::Now() > deadline_) {
      return Status::Err(ErrorCode::Transient, what + ": deadline of " + std::to_string(timeout_.count()) + "ms exceeded");
    }
    return Status::Ok();
  }

 private:
  util::TimePoint            deadline_;
  ObjectStoreClient::Timeout timeout_;
};

bool IsValidSessionId(const std::string& session_id) {
  if (session_id.empty()) return false;
  for (char c : session_id) {
    if (!std::isxdigit(static_cast<unsigned char>(c)) && c != '-') return false;
  }
  return true;
}

std::string VersionOf(const arrow::fs::FileInfo& info) {
  const auto mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(info.mtime().time_since_epoch()).count();
  return std::to_string(mtime_ns) + "-" + std::to_string(info.size());
}

} // namespace

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
}

std::string ArrowObjectStore::ObjectPath(const std::string& path) const {
  return JoinPath(root_path_, path);
}

std::string ArrowObjectStore::StagingDir(const std::string& session_id) const {
  return JoinPath(root_path_, std::string(kStagingPrefix) + "/" + session_id);
}

std::string ArrowObjectStore::StagedPartPath(const std::string& session_id, uint32_t sequence_number) const {
  return StagingDir(session_id) + "/" + std::to_string(sequence_number) + ".part";
}

arrow::Status ArrowObjectStore::WriteObject(const std::string& full_path, const std::shared_ptr<arrow::Buffer>& bytes,
                                            const std::string& content_type) const {
  auto parent = ParentOf(full_path);
  if (!parent.empty()) {
    ARROW_RETURN_NOT_OK(fs_->CreateDir(parent, /*recursive=*/true));
  }

  auto metadata = arrow::key_value_metadata({kContentTypeKey}, {content_type});
  ARROW_ASSIGN_OR_RAISE(auto out, fs_->OpenOutputStream(full_path, metadata));
  if (bytes && bytes->size() > 0) {
    ARROW_RETURN_NOT_OK(out->Write(bytes->data(), bytes->size()));
  }
  return out->Close();
}

arrow::Result<ArrowObjectStore::Manifest> ArrowObjectStore::ReadManifest(const std::string& session_id) const {
  ARROW_ASSIGN_OR_RAISE(auto input, fs_->OpenInputFile(StagingDir(session_id) + "/manifest"));
  ARROW_ASSIGN_OR_RAISE(auto size, input->GetSize());
  ARROW_ASSIGN_OR_RAISE(auto buffer, input->Read(size));

  std::istringstream in(buffer->ToString());
  Manifest           manifest;
  std::getline(in, manifest.path);
  std::getline(in, manifest.content_type);
  if (manifest.path.empty()) {
    return arrow::Status::IOError("corrupt multipart manifest for session ", session_id);
  }
  return manifest;
}

arrow::Result<ObjectDescriptor> ArrowObjectStore::Describe(const std::string& path, const std::string& content_type) const {
  ARROW_ASSIGN_OR_RAISE(auto info, fs_->GetFileInfo(ObjectPath(path)));

  ObjectDescriptor descriptor;
  descriptor.path         = path;
  descriptor.version_id   = VersionOf(info);
  descriptor.content_type = content_type;
  descriptor.size_bytes   = static_cast<uint64_t>(info.size());
  return descriptor;
}

// ------------------------------------------------------------
// Multipart
// ------------------------------------------------------------

StatusOr<std::string> ArrowObjectStore::InitiateMultipart(const std::string& path, const std::string& content_type, Timeout timeout) {
  STOWAGE_RETURN_IF_ERROR(ValidateObjectPath(path));
  CallDeadline deadline(timeout);

  const auto session_id = util::NewToken();
  auto       status     = fs_->CreateDir(StagingDir(session_id), /*recursive=*/true);
  if (status.ok()) {
    status = WriteObject(StagingDir(session_id) + "/manifest", arrow::Buffer::FromString(path + "\n" + content_type + "\n"), "text/plain");
  }
  STOWAGE_RETURN_IF_ERROR(ToStatus(status));
  STOWAGE_RETURN_IF_ERROR(deadline.Check("initiate " + path));
  return session_id;
}

StatusOr<std::string> ArrowObjectStore::UploadPart(const std::string& session_id, uint32_t sequence_number, const std::shared_ptr<arrow::Buffer>& bytes,
                                                   Timeout timeout) {
  if (!IsValidSessionId(session_id) || sequence_number == 0) {
    return Status::Err(ErrorCode::InvalidArgument, "invalid multipart session or part number");
  }
  CallDeadline deadline(timeout);

  auto info = fs_->GetFileInfo(StagingDir(session_id));
  if (!info.ok()) {
    return ToStatus(info.status());
  }
  if (info->type() != arrow::fs::FileType::Directory) {
    return Status::Err(ErrorCode::NotFound, "no such multipart session: " + session_id);
  }

  STOWAGE_RETURN_IF_ERROR(ToStatus(WriteObject(StagedPartPath(session_id, sequence_number), bytes, kDefaultContentType)));
  STOWAGE_RETURN_IF_ERROR(deadline.Check("upload part " + std::to_string(sequence_number)));
  return ContentTag(bytes);
}

StatusOr<ObjectDescriptor> ArrowObjectStore::CompleteMultipart(const std::string& session_id, const std::vector<PartTag>& parts, Timeout timeout) {
  if (!IsValidSessionId(session_id)) {
    return Status::Err(ErrorCode::InvalidArgument, "invalid multipart session id");
  }
  if (parts.empty()) {
    return Status::Err(ErrorCode::InvalidArgument, "completion requires at least one part");
  }
  // No deadline check: the object exists once bytes are assembled.
  (void)timeout;

  auto manifest = ReadManifest(session_id);
  if (!manifest.ok()) {
    return Status::Err(ErrorCode::NotFound, "no such multipart session: " + session_id + " (" + manifest.status().ToString() + ")");
  }

  // Verify every staged part against the tag the caller committed.
  std::vector<std::shared_ptr<arrow::Buffer>> staged;
  staged.reserve(parts.size());
  uint32_t previous = 0;
  for (const auto& part : parts) {
    if (part.sequence_number <= previous) {
      return Status::Err(ErrorCode::InvalidArgument, "parts must be listed in ascending sequence order");
    }
    previous = part.sequence_number;

    auto input = fs_->OpenInputFile(StagedPartPath(session_id, part.sequence_number));
    if (!input.ok()) {
      return Status::Err(ErrorCode::InvalidArgument, "part " + std::to_string(part.sequence_number) + " was never staged");
    }
    auto bytes = ToStatusOr(ReadAll(*input));
    if (!bytes.ok()) {
      return bytes.status();
    }
    if (ContentTag(*bytes) != part.etag) {
      return Status::Err(ErrorCode::InvalidArgument, "part " + std::to_string(part.sequence_number) + " has a stale etag");
    }
    staged.push_back(std::move(bytes).value());
  }

  const auto full_path = ObjectPath(manifest->path);
  auto       status    = arrow::Status::OK();
  if (const auto parent = ParentOf(full_path); !parent.empty()) {
    status = fs_->CreateDir(parent, /*recursive=*/true);
  }
  if (status.ok()) {
    auto metadata = arrow::key_value_metadata({kContentTypeKey}, {manifest->content_type});
    auto out      = fs_->OpenOutputStream(full_path, metadata);
    status        = out.status();
    if (out.ok()) {
      for (const auto& part : staged) {
        status = (*out)->Write(part->data(), part->size());
        if (!status.ok()) break;
      }
      auto close_status = (*out)->Close();
      if (status.ok()) status = close_status;
    }
  }
  STOWAGE_RETURN_IF_ERROR(ToStatus(status));
  STOWAGE_RETURN_IF_ERROR(ToStatus(fs_->DeleteDir(StagingDir(session_id))));

  auto descriptor = ToStatusOr(Describe(manifest->path, manifest->content_type));
  if (!descriptor.ok()) {
    return descriptor.status();
  }
  std::string etag_input;
  for (const auto& part : parts) etag_input += part.etag;
  descriptor->etag = ContentTag(arrow::Buffer::FromString(etag_input)) + "-" + std::to_string(parts.size());
  return descriptor;
}

Status ArrowObjectStore::AbortMultipart(const std::string& session_id, Timeout timeout) {
  if (!IsValidSessionId(session_id)) {
    return Status::Err(ErrorCode::InvalidArgument, "invalid multipart session id");
  }
  CallDeadline deadline(timeout);

  auto info = fs_->GetFileInfo(StagingDir(session_id));
  if (!info.ok()) {
    return ToStatus(info.status());
  }
  if (info->type() == arrow::fs::FileType::NotFound) {
    return Status::Ok();
  }
  STOWAGE_RETURN_IF_ERROR(ToStatus(fs_->DeleteDir(StagingDir(session_id))));
  return deadline.Check("abort " + session_id);
}

// ------------------------------------------------------------
// Single shot
// ------------------------------------------------------------

StatusOr<ObjectDescriptor> ArrowObjectStore::PutSingle(const std::string& path, const std::shared_ptr<arrow::Buffer>& bytes,
                                                       const std::string& content_type, Timeout timeout) {
  STOWAGE_RETURN_IF_ERROR(ValidateObjectPath(path));
  CallDeadline deadline(timeout);

  STOWAGE_RETURN_IF_ERROR(ToStatus(WriteObject(ObjectPath(path), bytes, content_type)));

  auto descriptor = ToStatusOr(Describe(path, content_type));
  if (!descriptor.ok()) {
    return descriptor.status();
  }
  descriptor->etag = ContentTag(bytes);

  STOWAGE_RETURN_IF_ERROR(deadline.Check("put " + path));
  return descriptor;
}

StatusOr<ObjectMetadata> ArrowObjectStore::GetMetadata(const std::string& path, Timeout timeout) {
  STOWAGE_RETURN_IF_ERROR(ValidateObjectPath(path));
  CallDeadline deadline(timeout);

  auto info = fs_->GetFileInfo(ObjectPath(path));
  if (!info.ok()) {
    return ToStatus(info.status());
  }
  if (info->type() != arrow::fs::FileType::File) {
    return Status::Err(ErrorCode::NotFound, "no such object: " + path);
  }

  ObjectMetadata metadata;
  metadata.version_id   = VersionOf(*info);
  metadata.size_bytes   = static_cast<uint64_t>(info->size());
  metadata.content_type = kDefaultContentType;

  auto stream = fs_->OpenInputStream(*info);
  if (stream.ok()) {
    auto kv = (*stream)->ReadMetadata();
    if (kv.ok() && *kv) {
      auto content_type = (*kv)->Get(kContentTypeKey);
      if (content_type.ok() && !content_type->empty()) {
        metadata.content_type = *content_type;
      }
    }
  }

  STOWAGE_RETURN_IF_ERROR(deadline.Check("stat " + path));
  return metadata;
}

StatusOr<std::shared_ptr<arrow::Buffer>> ArrowObjectStore::Get(const std::string& path, Timeout timeout) {
  STOWAGE_RETURN_IF_ERROR(ValidateObjectPath(path));
  CallDeadline deadline(timeout);

  auto info = fs_->GetFileInfo(ObjectPath(path));
  if (!info.ok()) {
    return ToStatus(info.status());
  }
  if (info->type() != arrow::fs::FileType::File) {
    return Status::Err(ErrorCode::NotFound, "no such object: " + path);
  }

  auto input = fs_->OpenInputFile(*info);
  if (!input.ok()) {
    return ToStatus(input.status());
  }
  auto bytes = ToStatusOr(ReadAll(*input));
  if (!bytes.ok()) {
    return bytes.status();
  }

  STOWAGE_RETURN_IF_ERROR(deadline.Check("get " + path));
  return bytes;
}

} // namespace stowage::storage

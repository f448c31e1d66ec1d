#include "chunk_planner.hpp"

#include <algorithm>
#include <string>

namespace stowage::upload {

using util::ErrorCode;
using util::Status;

util::StatusOr<std::vector<PartPlan>> ChunkPlanner::Plan(uint64_t total_size, uint64_t chunk_size) const {
  if (chunk_size == 0) {
    return Status::Err(ErrorCode::InvalidChunkSize, "chunk size must be positive");
  }
  if (total_size == 0) {
    return Status::Err(ErrorCode::InvalidChunkSize, "nothing to plan for an empty source");
  }

  const uint64_t part_count = PartCount(total_size, chunk_size);

  // A single part is also the last part, so the minimum does not apply.
  if (part_count > 1 && chunk_size < min_part_size_) {
    return Status::Err(ErrorCode::InvalidChunkSize,
                       "chunk size " + std::to_string(chunk_size) + " is below the minimum part size " + std::to_string(min_part_size_));
  }
  if (max_parts_ != 0 && part_count > max_parts_) {
    return Status::Err(ErrorCode::InvalidChunkSize,
                       "chunk size " + std::to_string(chunk_size) + " yields " + std::to_string(part_count) + " parts, limit is " +
                           std::to_string(max_parts_));
  }

  std::vector<PartPlan> parts;
  parts.reserve(static_cast<size_t>(part_count));

  uint64_t offset = 0;
  for (uint64_t i = 0; i < part_count; ++i) {
    PartPlan part;
    part.sequence_number = static_cast<uint32_t>(i + 1);
    part.byte_offset     = offset;
    part.byte_length     = std::min(chunk_size, total_size - offset);
    offset += part.byte_length;
    parts.push_back(part);
  }
  return parts;
}

} // namespace stowage::upload

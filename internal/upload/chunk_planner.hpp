#pragma once

#include <cstdint>
#include <vector>

#include "internal/util/errors.hpp"

namespace stowage::upload {

struct PartPlan {
  uint32_t sequence_number = 0; // 1-based
  uint64_t byte_offset     = 0;
  uint64_t byte_length     = 0;
};

/*
  Splits a byte range into ordered, fixed-size parts.

  Every part but the last is exactly `chunk_size` bytes; the last carries
  the remainder. Pure and deterministic.

  `min_part_size` is the provider-imposed minimum for non-final parts and
  `max_parts` the provider's part-count limit (0 = unlimited).
*/
class ChunkPlanner {
 public:
  ChunkPlanner() = default;
  ChunkPlanner(uint64_t min_part_size, uint32_t max_parts) : min_part_size_(min_part_size), max_parts_(max_parts) {
  }

  util::StatusOr<std::vector<PartPlan>> Plan(uint64_t total_size, uint64_t chunk_size) const;

  static uint64_t PartCount(uint64_t total_size, uint64_t chunk_size) {
    return chunk_size == 0 ? 0 : (total_size + chunk_size - 1) / chunk_size;
  }

 private:
  uint64_t min_part_size_ = 0;
  uint32_t max_parts_     = 0;
};

} // namespace stowage::upload

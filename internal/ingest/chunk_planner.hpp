#pragma once

#include <cstdint>
#include <vector>

namespace datahub::ingest {

constexpr uint64_t kMiB = 1024ull * 1024ull;
constexpr uint64_t kGiB = 1024ull * kMiB;

/*
  Chunk size policy.

  Size tiers pick a base chunk; the chunk then grows (in `alignment`
  steps) until the part count fits under max_parts. Content that cannot
  fit even with max_part_size parts is rejected.
*/
struct ChunkPolicy {
  uint64_t small_chunk      = 10 * kMiB;
  uint64_t medium_chunk     = 100 * kMiB;
  uint64_t large_chunk      = 500 * kMiB;
  uint64_t medium_threshold = 100 * kGiB;
  uint64_t large_threshold  = 1000 * kGiB;

  uint32_t max_parts     = 10000;
  uint64_t max_part_size = 5 * kGiB;
  uint64_t alignment     = kMiB;
};

struct PartRange {
  uint32_t part_number = 0;
  uint64_t offset      = 0;
  uint64_t length      = 0;
};

struct ChunkPlan {
  uint64_t total_size = 0;
  uint64_t chunk_size = 0;
  uint32_t part_count = 0;

  // part_number is 1-based.
  PartRange Part(uint32_t part_number) const;

  std::vector<uint32_t> AllParts() const;

  // Parts of AllParts() not in `received`, ascending.
  std::vector<uint32_t> MissingParts(const std::vector<uint32_t>& received) const;
};

// Pure and deterministic. Throws util::ValidationError when content is too large.
uint64_t PlanChunkSize(uint64_t content_size, const ChunkPolicy& policy = {});

ChunkPlan Plan(uint64_t content_size, const ChunkPolicy& policy = {});

// Plan for an existing session whose chunk size is already fixed.
ChunkPlan PlanWithChunkSize(uint64_t content_size, uint64_t chunk_size);

// Zero-byte content is a single empty part.
uint32_t PartCount(uint64_t content_size, uint64_t chunk_size);

} // namespace datahub::ingest

#include "chunk_planner.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace datahub::ingest {

namespace {

uint64_t CeilDiv(uint64_t a, uint64_t b) {
  return a / b + (a % b != 0 ? 1 : 0);
}

uint64_t TierChunk(uint64_t content_size, const ChunkPolicy& policy) {
  if (content_size >= policy.large_threshold) return policy.large_chunk;
  if (content_size >= policy.medium_threshold) return policy.medium_chunk;
  return policy.small_chunk;
}

} // namespace

uint32_t PartCount(uint64_t content_size, uint64_t chunk_size) {
  if (chunk_size == 0) throw std::invalid_argument("chunk size must be positive");
  if (content_size == 0) return 1;
  return static_cast<uint32_t>(CeilDiv(content_size, chunk_size));
}

uint64_t PlanChunkSize(uint64_t content_size, const ChunkPolicy& policy) {
  if (policy.max_parts == 0 || policy.max_part_size == 0 || policy.alignment == 0) {
    throw std::invalid_argument("chunk policy limits must be positive");
  }

  uint64_t chunk = std::min(TierChunk(content_size, policy), policy.max_part_size);

  if (CeilDiv(content_size, chunk) > policy.max_parts) {
    uint64_t needed = CeilDiv(content_size, policy.max_parts);
    chunk           = CeilDiv(needed, policy.alignment) * policy.alignment;
  }

  if (chunk > policy.max_part_size) {
    chunk = policy.max_part_size;
    if (CeilDiv(content_size, chunk) > policy.max_parts) {
      throw util::ValidationError("content of " + std::to_string(content_size) + " bytes exceeds the largest supported upload");
    }
  }
  return chunk;
}

ChunkPlan Plan(uint64_t content_size, const ChunkPolicy& policy) {
  return PlanWithChunkSize(content_size, PlanChunkSize(content_size, policy));
}

ChunkPlan PlanWithChunkSize(uint64_t content_size, uint64_t chunk_size) {
  ChunkPlan plan;
  plan.total_size = content_size;
  plan.chunk_size = chunk_size;
  plan.part_count = PartCount(content_size, chunk_size);
  return plan;
}

PartRange ChunkPlan::Part(uint32_t part_number) const {
  if (part_number == 0 || part_number > part_count) {
    throw util::ValidationError("part number " + std::to_string(part_number) + " outside 1.." + std::to_string(part_count));
  }
  PartRange range;
  range.part_number = part_number;
  range.offset      = static_cast<uint64_t>(part_number - 1) * chunk_size;
  range.length      = std::min(chunk_size, total_size - range.offset);
  return range;
}

std::vector<uint32_t> ChunkPlan::AllParts() const {
  std::vector<uint32_t> parts;
  parts.reserve(part_count);
  for (uint32_t n = 1; n <= part_count; ++n)
    parts.push_back(n);
  return parts;
}

std::vector<uint32_t> ChunkPlan::MissingParts(const std::vector<uint32_t>& received) const {
  std::vector<bool> have(static_cast<size_t>(part_count) + 1, false);
  for (auto n : received) {
    if (n >= 1 && n <= part_count) have[n] = true;
  }
  std::vector<uint32_t> missing;
  for (auto n : AllParts()) {
    if (!have[n]) missing.push_back(n);
  }
  return missing;
}

} // namespace datahub::ingest

#include "chunk_planner.hpp"
#include <algorithm>

namespace blockcopy::core {

ChunkPlanner::ChunkPlanner(std::uint64_t total_bytes,
                           std::uint32_t min_chunk_size,
                           std::uint32_t max_chunk_size,
                           std::mt19937_64& rng)
    : total_bytes_(total_bytes)
    , size_dist_(std::max<std::uint32_t>(1, min_chunk_size),
                 std::max<std::uint32_t>(1, std::max(min_chunk_size, max_chunk_size)))
    , rng_(rng)
{}

auto ChunkPlanner::next() -> std::optional<BlockDescriptor> {
    if (exhausted()) {
        return std::nullopt;
    }

    const std::uint64_t remaining = total_bytes_ - offset_;
    const std::uint64_t sampled = size_dist_(rng_);
    const auto length = static_cast<std::uint32_t>(std::min(sampled, remaining));

    BlockDescriptor block{
        .sequence_number = next_sequence_++,
        .offset = offset_,
        .length = length
    };
    offset_ += length;
    return block;
}

} // namespace blockcopy::core

#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include "../types.hpp"

namespace blockcopy::core {

// Ленивое разбиение [0, total_bytes) на блоки случайной длины
// из [min_chunk_size, max_chunk_size]; последний блок обрезается по хвосту.
// Последовательность одноразовая: перезапуска нет.
class ChunkPlanner {
public:
    ChunkPlanner(std::uint64_t total_bytes,
                 std::uint32_t min_chunk_size,
                 std::uint32_t max_chunk_size,
                 std::mt19937_64& rng);

    [[nodiscard]] auto next() -> std::optional<BlockDescriptor>;

    [[nodiscard]] auto exhausted() const noexcept -> bool { return offset_ >= total_bytes_; }
    [[nodiscard]] auto planned_bytes() const noexcept -> std::uint64_t { return offset_; }
    [[nodiscard]] auto planned_blocks() const noexcept -> std::uint32_t { return next_sequence_ - 1; }

private:
    std::uint64_t total_bytes_;
    std::uniform_int_distribution<std::uint32_t> size_dist_;
    std::mt19937_64& rng_;
    std::uint64_t offset_ = 0;
    std::uint32_t next_sequence_ = 1;
};

} // namespace blockcopy::core

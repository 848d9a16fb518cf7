#pragma once

#include "bulkup/core/result.hpp"

#include <cstdint>
#include <vector>

namespace bulkup::transfer {

class ChunkPlan;

Result<ChunkPlan> plan_chunks(std::uint64_t file_size, std::uint64_t chunk_size);

/**
 * @brief Byte range [offset, offset + length) covered by one chunk
 */
struct ChunkRange {
    std::uint32_t index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;

    [[nodiscard]] std::uint64_t end() const noexcept { return offset + length; }
};

/**
 * @brief Chunk boundaries for one file
 *
 * Ranges are contiguous and partition the file exactly; only the last chunk
 * may be shorter than chunk_size. A zero-byte file has no chunks.
 */
class ChunkPlan {
public:
    [[nodiscard]] std::uint64_t file_size() const noexcept { return file_size_; }
    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint32_t total_chunks() const noexcept { return total_chunks_; }

    [[nodiscard]] ChunkRange range(std::uint32_t index) const;
    [[nodiscard]] std::vector<ChunkRange> ranges() const;

private:
    friend Result<ChunkPlan> plan_chunks(std::uint64_t file_size, std::uint64_t chunk_size);

    ChunkPlan(std::uint64_t file_size, std::uint64_t chunk_size, std::uint32_t total_chunks);

    std::uint64_t file_size_;
    std::uint64_t chunk_size_;
    std::uint32_t total_chunks_;
};

} // namespace bulkup::transfer

#include "bulkup/transfer/chunk_planner.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace bulkup::transfer {

ChunkPlan::ChunkPlan(std::uint64_t file_size, std::uint64_t chunk_size, std::uint32_t total_chunks)
    : file_size_(file_size), chunk_size_(chunk_size), total_chunks_(total_chunks) {}

ChunkRange ChunkPlan::range(std::uint32_t index) const {
    ChunkRange range;
    range.index = index;
    range.offset = std::min(static_cast<std::uint64_t>(index) * chunk_size_, file_size_);
    range.length = std::min(chunk_size_, file_size_ - range.offset);
    return range;
}

std::vector<ChunkRange> ChunkPlan::ranges() const {
    std::vector<ChunkRange> result;
    result.reserve(total_chunks_);
    for (std::uint32_t i = 0; i < total_chunks_; ++i) {
        result.push_back(range(i));
    }
    return result;
}

Result<ChunkPlan> plan_chunks(std::uint64_t file_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        return Fail<ChunkPlan>(ErrorCode::Validation, "chunk_size must be > 0");
    }
    const std::uint64_t chunks = file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
    if (chunks > std::numeric_limits<std::uint32_t>::max()) {
        return Fail<ChunkPlan>(ErrorCode::Validation,
            "File of " + std::to_string(file_size) + " bytes needs too many chunks of " + std::to_string(chunk_size));
    }
    return Ok(ChunkPlan(file_size, chunk_size, static_cast<std::uint32_t>(chunks)));
}

} // namespace bulkup::transfer

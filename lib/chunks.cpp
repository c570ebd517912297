#include "ipod/algorithms/chunks.hpp"

#include <algorithm>
#include <stdexcept>

namespace ipod::algorithms {

SizeType effective_chunk_size(SizeType num_items,
                              SizeType max_workers,
                              SizeType chunk_size) {
    if (max_workers == 0) {
        throw std::invalid_argument("max_workers must be at least 1");
    }
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be at least 1");
    }
    const auto per_worker = (num_items + max_workers - 1) / max_workers;
    return std::min(per_worker, chunk_size);
}

ChunkPlanner::ChunkPlanner(SizeType num_items, SizeType chunk_size)
    : m_num_items(num_items),
      m_chunk_size(chunk_size) {
    if (m_num_items > 0 && m_chunk_size == 0) {
        throw std::invalid_argument(
            "ChunkPlanner: chunk_size must be positive for a non-empty input");
    }
}

SizeType ChunkPlanner::size() const noexcept {
    if (m_num_items == 0) {
        return 0;
    }
    return (m_num_items + m_chunk_size - 1) / m_chunk_size;
}

std::vector<ChunkRange> ChunkPlanner::to_vector() const {
    std::vector<ChunkRange> chunks;
    chunks.reserve(size());
    for (const auto chunk : *this) {
        chunks.push_back(chunk);
    }
    return chunks;
}

} // namespace ipod::algorithms

#pragma once

#include <cstddef>
#include <iterator>
#include <vector>

#include "ipod/common/types.hpp"

namespace ipod::algorithms {

// Half-open range [start, end) of positions in the orbit identifier list
struct ChunkRange {
    SizeType start{};
    SizeType end{};

    [[nodiscard]] SizeType size() const noexcept { return end - start; }
    bool operator==(const ChunkRange&) const = default;
};

/**
 * @brief Chunk size that keeps every worker busy for small inputs.
 *
 * Returns min(ceil(num_items / max_workers), chunk_size), and 0 when there
 * are no items.
 *
 * @throws std::invalid_argument if max_workers or chunk_size is 0.
 */
[[nodiscard]] SizeType effective_chunk_size(SizeType num_items,
                                            SizeType max_workers,
                                            SizeType chunk_size);

/**
 * @brief Lazy, restartable sequence of contiguous chunks covering
 * [0, num_items).
 *
 * Chunks are disjoint, ordered by start and all of size chunk_size except
 * possibly the last one.
 */
class ChunkPlanner {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = ChunkRange;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const ChunkRange*;
        using reference         = ChunkRange;

        iterator() = default;
        iterator(SizeType start, SizeType num_items, SizeType chunk_size)
            : m_start(start),
              m_num_items(num_items),
              m_chunk_size(chunk_size) {}

        ChunkRange operator*() const {
            const auto end = (m_num_items - m_start > m_chunk_size)
                                 ? m_start + m_chunk_size
                                 : m_num_items;
            return {.start = m_start, .end = end};
        }
        iterator& operator++() {
            m_start = (**this).end;
            return *this;
        }
        iterator operator++(int) {
            auto tmp = *this;
            ++(*this);
            return tmp;
        }
        bool operator==(const iterator& other) const {
            return m_start == other.m_start;
        }

    private:
        SizeType m_start{};
        SizeType m_num_items{};
        SizeType m_chunk_size{};
    };

    ChunkPlanner(SizeType num_items, SizeType chunk_size);

    [[nodiscard]] iterator begin() const {
        return {0, m_num_items, m_chunk_size};
    }
    [[nodiscard]] iterator end() const {
        return {m_num_items, m_num_items, m_chunk_size};
    }

    [[nodiscard]] SizeType size() const noexcept;
    [[nodiscard]] SizeType get_num_items() const noexcept {
        return m_num_items;
    }
    [[nodiscard]] SizeType get_chunk_size() const noexcept {
        return m_chunk_size;
    }
    [[nodiscard]] std::vector<ChunkRange> to_vector() const;

private:
    SizeType m_num_items;
    SizeType m_chunk_size;
};

} // namespace ipod::algorithms

#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

#include "ipod/common/types.hpp"

namespace ipod::data {

/**
 * @brief A sequence of rows stored as a list of contiguous blocks.
 *
 * Appending another batch transfers its blocks without copying rows, so a
 * batch built from many small appends becomes fragmented. @ref compact
 * restores a geometric block layout, @ref defragment moves every row into a
 * single block.
 *
 * Layout invariant kept by @ref compact: every block holds more than twice
 * the rows of the block that follows it. A batch is @ref fragmented when
 * its last block breaks the invariant. Compaction merges from the back, like
 * a binary counter, so under a stream of appends each row is moved
 * O(log n) times and a batch never holds more than O(log n) blocks.
 *
 * @tparam Row Plain row aggregate.
 */
template <typename Row> class RecordBatch {
public:
    using value_type = Row;
    using Block      = std::vector<Row>;

    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = Row;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const Row*;
        using reference         = const Row&;

        const_iterator() = default;
        const_iterator(const std::vector<Block>* blocks,
                       SizeType block,
                       SizeType offset)
            : m_blocks(blocks),
              m_block(block),
              m_offset(offset) {
            normalize();
        }

        reference operator*() const { return (*m_blocks)[m_block][m_offset]; }
        pointer operator->() const { return &(*m_blocks)[m_block][m_offset]; }

        const_iterator& operator++() {
            ++m_offset;
            normalize();
            return *this;
        }
        const_iterator operator++(int) {
            auto tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const const_iterator& other) const {
            return m_block == other.m_block && m_offset == other.m_offset;
        }

    private:
        const std::vector<Block>* m_blocks{nullptr};
        SizeType m_block{};
        SizeType m_offset{};

        void normalize() {
            if (m_blocks == nullptr) {
                return;
            }
            while (m_block < m_blocks->size() &&
                   m_offset >= (*m_blocks)[m_block].size()) {
                ++m_block;
                m_offset = 0;
            }
        }
    };

    RecordBatch() = default;
    explicit RecordBatch(std::vector<Row> rows) {
        if (!rows.empty()) {
            m_size = rows.size();
            m_blocks.push_back(std::move(rows));
        }
    }
    RecordBatch(std::initializer_list<Row> rows)
        : RecordBatch(std::vector<Row>(rows)) {}

    [[nodiscard]] SizeType size() const noexcept { return m_size; }
    [[nodiscard]] bool empty() const noexcept { return m_size == 0; }
    [[nodiscard]] SizeType num_blocks() const noexcept {
        return m_blocks.size();
    }

    [[nodiscard]] bool fragmented() const noexcept {
        const auto n = m_blocks.size();
        if (n <= 1) {
            return false;
        }
        return m_blocks[n - 1].size() * 2 >= m_blocks[n - 2].size();
    }

    // Concatenate by block transfer; rows of other are not copied
    void append(RecordBatch&& other) {
        for (auto& block : other.m_blocks) {
            if (!block.empty()) {
                m_size += block.size();
                m_blocks.push_back(std::move(block));
            }
        }
        other.m_blocks.clear();
        other.m_size = 0;
    }

    void append(const RecordBatch& other) {
        RecordBatch copy = other;
        append(std::move(copy));
    }

    void push_back(Row row) {
        if (m_blocks.empty()) {
            m_blocks.emplace_back();
        }
        m_blocks.back().push_back(std::move(row));
        ++m_size;
    }

    // Merge trailing blocks until the geometric layout holds again
    void compact() {
        while (fragmented()) {
            Block last = std::move(m_blocks.back());
            m_blocks.pop_back();
            Block& prev = m_blocks.back();
            prev.insert(prev.end(), std::make_move_iterator(last.begin()),
                        std::make_move_iterator(last.end()));
        }
    }

    // Compact all rows into a single contiguous block
    void defragment() {
        if (m_blocks.size() <= 1) {
            return;
        }
        Block& head = m_blocks.front();
        head.reserve(m_size);
        for (auto it = std::next(m_blocks.begin()); it != m_blocks.end();
             ++it) {
            std::move(it->begin(), it->end(), std::back_inserter(head));
        }
        m_blocks.erase(std::next(m_blocks.begin()), m_blocks.end());
    }

    [[nodiscard]] const Row& operator[](SizeType idx) const {
        for (const auto& block : m_blocks) {
            if (idx < block.size()) {
                return block[idx];
            }
            idx -= block.size();
        }
        throw std::out_of_range("RecordBatch: row index out of range");
    }

    [[nodiscard]] const_iterator begin() const {
        return const_iterator(&m_blocks, 0, 0);
    }
    [[nodiscard]] const_iterator end() const {
        return const_iterator(&m_blocks, m_blocks.size(), 0);
    }

    // Copy of all rows in order, as one vector
    [[nodiscard]] std::vector<Row> to_vector() const {
        std::vector<Row> rows;
        rows.reserve(m_size);
        for (const auto& block : m_blocks) {
            rows.insert(rows.end(), block.begin(), block.end());
        }
        return rows;
    }

    // Move all rows out as one vector, leaving the batch empty
    [[nodiscard]] std::vector<Row> release() && {
        defragment();
        std::vector<Row> rows;
        if (!m_blocks.empty()) {
            rows = std::move(m_blocks.front());
        }
        m_blocks.clear();
        m_size = 0;
        return rows;
    }

    template <typename Predicate>
    [[nodiscard]] RecordBatch filter(Predicate pred) const {
        std::vector<Row> rows;
        for (const auto& block : m_blocks) {
            std::copy_if(block.begin(), block.end(), std::back_inserter(rows),
                         pred);
        }
        return RecordBatch(std::move(rows));
    }

private:
    std::vector<Block> m_blocks;
    SizeType m_size{};
};

/**
 * @brief Append @p chunk to @p total and compact @p total when it has become
 * fragmented.
 *
 * @p chunk is flattened to one block first, so the layout invariant holds
 * for every block of @p total and not just the last two.
 */
template <typename Row>
void concatenate_into(RecordBatch<Row>& total, RecordBatch<Row>&& chunk) {
    chunk.defragment();
    total.append(std::move(chunk));
    if (total.fragmented()) {
        total.compact();
    }
}

} // namespace ipod::data

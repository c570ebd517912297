#pragma once

#include "ipod/common/types.hpp"
#include "ipod/data/results.hpp"

namespace ipod::algorithms {

/**
 * @brief Running totals of the four result collections of a run.
 *
 * Each merged quadruple is appended by block transfer and the affected
 * collection is compacted when it becomes fragmented. Only the thread that
 * drives the run mutates the totals. Row order follows merge order and is
 * not part of the contract.
 */
class ResultAccumulator {
public:
    ResultAccumulator() = default;

    void merge(data::ResultBatches&& chunk);

    // Hand out the totals, leaving the accumulator empty
    [[nodiscard]] data::ResultBatches take();

    [[nodiscard]] const data::ResultBatches& get_totals() const noexcept {
        return m_totals;
    }
    [[nodiscard]] SizeType get_num_merged() const noexcept {
        return m_num_merged;
    }

private:
    data::ResultBatches m_totals;
    SizeType m_num_merged{};
};

} // namespace ipod::algorithms

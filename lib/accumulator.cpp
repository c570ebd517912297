#include "ipod/algorithms/accumulator.hpp"

#include <utility>

namespace ipod::algorithms {

void ResultAccumulator::merge(data::ResultBatches&& chunk) {
    data::concatenate_into(m_totals.orbits, std::move(chunk.orbits));
    data::concatenate_into(m_totals.members, std::move(chunk.members));
    data::concatenate_into(m_totals.candidates, std::move(chunk.candidates));
    data::concatenate_into(m_totals.summaries, std::move(chunk.summaries));
    ++m_num_merged;
}

data::ResultBatches ResultAccumulator::take() {
    data::ResultBatches totals = std::exchange(m_totals, {});
    totals.orbits.defragment();
    totals.members.defragment();
    totals.candidates.defragment();
    totals.summaries.defragment();
    m_num_merged = 0;
    return totals;
}

} // namespace ipod::algorithms

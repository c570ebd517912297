#pragma once

#include "ipod/common/types.hpp"
#include "ipod/data/tables.hpp"

namespace ipod::data {

/**
 * @brief The four output collections of a refinement.
 *
 * Produced once per orbit by the refinement routine, once per chunk by the
 * chunk worker and once per run by the accumulator.
 */
struct ResultBatches {
    FittedOrbits orbits;
    FittedOrbitMembers members;
    PrecoveryCandidates candidates;
    SearchSummaries summaries;

    [[nodiscard]] bool empty() const noexcept {
        return orbits.empty() && members.empty() && candidates.empty() &&
               summaries.empty();
    }
};

} // namespace ipod::data

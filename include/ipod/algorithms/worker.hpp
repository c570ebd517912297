#pragma once

#include <memory>
#include <span>

#include "ipod/common/types.hpp"
#include "ipod/data/results.hpp"
#include "ipod/data/tables.hpp"
#include "ipod/refine/refiner.hpp"

namespace ipod::algorithms {

// Read-only tables shared by every chunk of a run
struct ChunkInputs {
    std::shared_ptr<const data::OrbitTable> orbits;
    std::shared_ptr<const data::MemberTable> members;
    std::shared_ptr<const data::ObservationTable> observations;
    std::shared_ptr<const data::OutlierTable> outliers;
};

/**
 * @brief Refines the orbits of one chunk against a private precovery index
 * handle.
 *
 * Orbits are processed in the given order. The first failure aborts the
 * chunk: it is logged and rethrown, and no partial result is returned. The
 * index handle is opened once per call and closed on every exit path.
 */
class ChunkWorker {
public:
    ChunkWorker(std::shared_ptr<refine::Refiner> refiner,
                refine::IndexOpener opener,
                refine::IndexOptions options,
                refine::RefinementParams params);

    /**
     * @param orbit_ids  Identifiers of the chunk, in plan order.
     * @param inputs     Shared run tables; members and observations are
     *                   only used when both are present.
     * @throws LookupError      if an identifier is not exactly one orbit.
     * @throws RefinementError  if the refinement routine fails.
     */
    [[nodiscard]] data::ResultBatches
    process(std::span<const OrbitID> orbit_ids,
            const ChunkInputs& inputs) const;

private:
    std::shared_ptr<refine::Refiner> m_refiner;
    refine::IndexOpener m_opener;
    refine::IndexOptions m_options;
    refine::RefinementParams m_params;
};

} // namespace ipod::algorithms

#include "ipod/algorithms/worker.hpp"

#include <exception>
#include <format>
#include <utility>

#include <spdlog/spdlog.h>

#include "ipod/common/errors.hpp"
#include "ipod/exceptions.hpp"

namespace ipod::algorithms {

ChunkWorker::ChunkWorker(std::shared_ptr<refine::Refiner> refiner,
                         refine::IndexOpener opener,
                         refine::IndexOptions options,
                         refine::RefinementParams params)
    : m_refiner(std::move(refiner)),
      m_opener(std::move(opener)),
      m_options(std::move(options)),
      m_params(std::move(params)) {
    error_check::check_not_null(m_refiner.get(),
                                "ChunkWorker: refiner must not be null");
}

data::ResultBatches ChunkWorker::process(std::span<const OrbitID> orbit_ids,
                                         const ChunkInputs& inputs) const {
    error_check::check_not_null(inputs.orbits.get(),
                                "ChunkWorker: candidate orbits are required");
    refine::IndexHandle index(m_opener, m_options);

    data::ResultBatches chunk;
    for (const auto& orbit_id : orbit_ids) {
        try {
            const auto& candidate = data::select_orbit(*inputs.orbits, orbit_id);
            const auto observations = data::build_orbit_observations(
                inputs.members.get(), inputs.observations.get(), orbit_id);
            auto params = m_params;
            params.known_outliers =
                data::select_outlier_obs_ids(inputs.outliers.get(), orbit_id);

            auto result =
                m_refiner->refine(candidate, observations, index.get(), params);
            data::concatenate_into(chunk.orbits, std::move(result.orbits));
            data::concatenate_into(chunk.members, std::move(result.members));
            data::concatenate_into(chunk.candidates,
                                   std::move(result.candidates));
            data::concatenate_into(chunk.summaries,
                                   std::move(result.summaries));
        } catch (const LookupError& e) {
            spdlog::error("Error processing orbit {}: {}", orbit_id, e.what());
            throw;
        } catch (const RefinementError& e) {
            spdlog::error("Error processing orbit {}: {}", orbit_id, e.what());
            throw;
        } catch (const std::exception& e) {
            spdlog::error("Error processing orbit {}: {}", orbit_id, e.what());
            throw RefinementError(
                orbit_id,
                std::format("Error processing orbit {}: {}", orbit_id,
                            e.what()));
        }
    }
    index.close();
    return chunk;
}

} // namespace ipod::algorithms
